#ifndef CLAPARSE_VERSION_HPP
#define CLAPARSE_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define CLAPARSE_VERSION_MAJOR 1
#define CLAPARSE_VERSION_MINOR 4
#define CLAPARSE_VERSION_PATCH 0

/*
 * Release tag, kept in sync with project(VERSION) in CMakeLists.txt.
 * Example format: "1.4.0".
 */
#define CLAPARSE_VERSION_STR "1.4.0"
/* ------------------------------------------------------------------ */

namespace claparse {
/* Human-friendly version string for the C++ codebase */
constexpr const char* VERSION = CLAPARSE_VERSION_STR;
} // namespace claparse

#endif /* CLAPARSE_VERSION_HPP */
