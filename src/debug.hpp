#ifndef _SFTP_TOOLKIT_DEBUG
#define _SFTP_TOOLKIT_DEBUG

#include <cstdio>

/*
 * LOG_LEVEL
 *   0 : silent
 *   1 : errors only
 *   2 : errors and warnings
 *   3 : everything, including traversal traces
 * */

#ifndef NDEBUG
#	ifndef LOG_LEVEL
#		define LOG_LEVEL 3
#	endif
#endif

#ifndef LOG_LEVEL
#	define LOG_LEVEL 1
#endif

#if LOG_LEVEL >= 1
#	define LOG_ERR(...) fprintf(stderr, "[stk:err] " __VA_ARGS__)
#else
#	define LOG_ERR(...) ((void)0)
#endif

#if LOG_LEVEL >= 2
#	define LOG_WRN(...) fprintf(stderr, "[stk:wrn] " __VA_ARGS__)
#else
#	define LOG_WRN(...) ((void)0)
#endif

#if LOG_LEVEL >= 3
#	define LOG_DBG(...) fprintf(stdout, "[stk:dbg] " __VA_ARGS__)
#else
#	define LOG_DBG(...) ((void)0)
#endif

#ifndef NDEBUG
/** Alias for SIGTRAP in debug mode. */
#	if defined(_MSC_VER)
#		define BREAKPOINT() __debugbreak()
#	elif defined(__has_builtin) && __has_builtin(__builtin_debugtrap)
#		define BREAKPOINT() __builtin_debugtrap()
#	else
#		include <signal.h>
#		define BREAKPOINT() raise(SIGTRAP)
#	endif

#	define UNREACHABLE_MSG(...)                                               \
		do {                                                                   \
			LOG_ERR(__VA_ARGS__);                                              \
			fprintf(                                                           \
				stderr, "Should be Unreachable %s:%d\n", __FILE__, __LINE__);  \
			BREAKPOINT();                                                      \
		} while (0)

#else

#	define BREAKPOINT()         ((void)0)
#	define UNREACHABLE_MSG(...) LOG_ERR(__VA_ARGS__)

#endif

#endif
