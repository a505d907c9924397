#ifndef STRATRELEASE_VERSION_HPP
#define STRATRELEASE_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros (safe for .rc files)               */
#define STRATRELEASE_VERSION_MAJOR 1
#define STRATRELEASE_VERSION_MINOR 0
#define STRATRELEASE_VERSION_PATCH 0

#define STRATRELEASE_VERSION_STR "1.0.0"
#define STRATRELEASE_VERSION_RC                                                                    \
    STRATRELEASE_VERSION_MAJOR, STRATRELEASE_VERSION_MINOR, STRATRELEASE_VERSION_PATCH, 0
/* ------------------------------------------------------------------ */

#ifndef RC_INVOKED
constexpr const char* STRATRELEASE_VERSION = STRATRELEASE_VERSION_STR;
#endif /* RC_INVOKED */

#endif /* STRATRELEASE_VERSION_HPP */
