#ifndef GFD_ASSERT_H
#define GFD_ASSERT_H


// always check asserts, except where project logic dictates otherwise
#ifdef NDEBUG
#undef NDEBUG
#define UNDEF_NDEBUG
#endif
#include <cassert>
#ifdef UNDEF_NDEBUG
#define NDEBUG
#undef UNDEF_NDEBUG
#endif


/*
* Contract checks are split into three groups so that each can
* be switched off on its own. Index construction runs them on
* every triple, so disable them when measuring mining throughput.
* Recoverable conditions (bad literal values, unknown keys) are
* never reported through these macros.
* GFD_DISABLE_ALL_CHECKS is set by the build (see CMakeLists.txt).
*/


#ifdef GFD_DISABLE_ALL_CHECKS
#define GFD_DISABLE_CHECK_PRECOND
#define GFD_DISABLE_CHECK_POSTCOND
#define GFD_DISABLE_CHECK_INVARIANT
#endif


#ifndef GFD_DISABLE_CHECK_PRECOND
#define GFD_CHECK_PRECOND(expr) assert(expr)
#define GFD_CHECKING_PRECONDS
#else
#define GFD_CHECK_PRECOND(expr) ((void)0)
#endif


#ifndef GFD_DISABLE_CHECK_POSTCOND
#define GFD_CHECK_POSTCOND(expr) assert(expr)
#define GFD_CHECKING_POSTCONDS
#else
#define GFD_CHECK_POSTCOND(expr) ((void)0)
#endif


#ifndef GFD_DISABLE_CHECK_INVARIANT
#define GFD_CHECK_INVARIANT(expr) assert(expr)
#define GFD_CHECKING_INVARIANTS
#else
#define GFD_CHECK_INVARIANT(expr) ((void)0)
#endif


#endif  // GFD_ASSERT_H
