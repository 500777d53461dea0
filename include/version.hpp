#ifndef MEMSYNC_VERSION_HPP
#define MEMSYNC_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define MEMSYNC_VERSION_MAJOR 0
#define MEMSYNC_VERSION_MINOR 3
#define MEMSYNC_VERSION_PATCH 0

/*
 * Release tag injected by the packaging workflow.
 * Example format: "0.3.0-2".
 */
#define MEMSYNC_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* MEMSYNC_VERSION = MEMSYNC_VERSION_STR;

#endif /* MEMSYNC_VERSION_HPP */
