#ifndef AUTOGITPUSH_VERSION_HPP
#define AUTOGITPUSH_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define AUTOGITPUSH_VERSION_MAJOR 0
#define AUTOGITPUSH_VERSION_MINOR 1
#define AUTOGITPUSH_VERSION_PATCH 0

/*
 * Release tag, overridden by the build when packaging.
 */
#ifndef AUTOGITPUSH_VERSION_STR
#define AUTOGITPUSH_VERSION_STR "0.1.0"
#endif
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* AUTOGITPUSH_VERSION = AUTOGITPUSH_VERSION_STR;

#endif /* AUTOGITPUSH_VERSION_HPP */
