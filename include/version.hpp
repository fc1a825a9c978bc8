#ifndef DIFFWATCH_VERSION_HPP
#define DIFFWATCH_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define DIFFWATCH_VERSION_MAJOR 0
#define DIFFWATCH_VERSION_MINOR 3
#define DIFFWATCH_VERSION_PATCH 0

#define DIFFWATCH_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

constexpr const char* DIFFWATCH_VERSION = DIFFWATCH_VERSION_STR;

#endif /* DIFFWATCH_VERSION_HPP */
