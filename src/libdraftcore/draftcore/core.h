// =====================================================================
//  src/libdraftcore/draftcore/core.h — Library version and export macros
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_CORE_H
#define DRAFTCORE_CORE_H

#include <QtGlobal>

// DRAFTCORE_SHARED is a PUBLIC definition of the shared library target;
// DRAFTCORE_BUILDING is only set while compiling the library itself.
#if !defined(DRAFTCORE_SHARED)
  #define DRAFTCORE_EXPORT
#elif defined(DRAFTCORE_BUILDING)
  #define DRAFTCORE_EXPORT Q_DECL_EXPORT
#else
  #define DRAFTCORE_EXPORT Q_DECL_IMPORT
#endif

namespace draftcore {

/// Version the library was built as, e.g. "0.1.0".
DRAFTCORE_EXPORT const char* version();

}  // namespace draftcore

#endif  // DRAFTCORE_CORE_H
