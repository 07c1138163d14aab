// =====================================================================
//  src/libdraftcore/core.cpp — Library version
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/core.h>

#ifndef DRAFTCORE_VERSION
#define DRAFTCORE_VERSION "0.1.0"
#endif

namespace draftcore {

const char* version()
{
    return DRAFTCORE_VERSION;
}

}  // namespace draftcore
