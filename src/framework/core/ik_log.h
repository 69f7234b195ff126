#ifndef _IK_LOG_H_
#define _IK_LOG_H_

#include <stdarg.h>

/*
 * Synchronous stderr logger shared by the library, its utilities and
 * tests. Every line carries a UTC timestamp, the level name and the
 * qualified name of the logging function.
 */

enum ik_log_level {
    IK_LOG_NONE = 0,
    IK_LOG_CRITICAL,
    IK_LOG_ERROR,
    IK_LOG_WARNING,
    IK_LOG_INFO,
    IK_LOG_DEBUG,
    IK_LOG_TRACE,
    IK_LOG_MAX,
};

/* Process wide threshold; messages above it are dropped. Default: info */
enum ik_log_level ik_log_level_get(void);
void ik_log_level_set(enum ik_log_level level);

/* "none".."trace" or "unknown" */
const char* ik_log_level_name(enum ik_log_level level);

/**
 * Map a user supplied level, either its number (1-6) or its name in any
 * case, to a level.
 *
 * @return
 *   the level, or IK_LOG_NONE if arg names none
 */
enum ik_log_level parse_log_optarg(const char* arg);

/**
 * Copy the qualified function name out of a __PRETTY_FUNCTION__ string,
 * dropping the return type, the argument list and any template binding
 * suffix. function must hold at least strlen(signature) + 1 chars.
 */
void ik_log_function_name(const char* signature, char* function);

int ik_log(enum ik_log_level level, const char* tag, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

/* As ik_log(), tagging the message with the function named by signature */
int ik_log_signed(enum ik_log_level level,
                  const char* signature,
                  const char* format,
                  ...) __attribute__((format(printf, 3, 4)));

/*
 * Preferred entry point: arguments are only evaluated when the level is
 * enabled.
 */
#define IK_LOG(level, format, ...)                                             \
    do {                                                                       \
        if ((level) <= ik_log_level_get()) {                                   \
            ik_log_signed((level), __PRETTY_FUNCTION__, format, ##__VA_ARGS__);\
        }                                                                      \
    } while (0)

#endif /* _IK_LOG_H_ */
