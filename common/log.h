#pragma once

#include <string>

// Logging for the coordination library and tools.
//
// Messages go to stderr (and optionally to a file) with a timestamp and level
// prefix. Anything above the verbosity threshold is discarded before
// formatting.

enum coord_log_level {
    COORD_LOG_LEVEL_ERROR = 0,
    COORD_LOG_LEVEL_WARN  = 1,
    COORD_LOG_LEVEL_INFO  = 2,
    COORD_LOG_LEVEL_DEBUG = 3,
};

// Messages with a level greater than the threshold are dropped
void coord_log_set_verbosity(int level);
int  coord_log_get_verbosity();

// Also append log lines to a file (empty path disables the file sink)
bool coord_log_set_file(const std::string & path);

// Enable/disable timestamps and level prefixes
void coord_log_set_prefix(bool enabled);

void coord_log_write(int level, const char * fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

#define LOG_TMPL(level, ...)                                  \
    do {                                                      \
        if ((level) <= coord_log_get_verbosity()) {           \
            coord_log_write((level), __VA_ARGS__);            \
        }                                                     \
    } while (0)

#define LOG_ERR(...) LOG_TMPL(COORD_LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_WRN(...) LOG_TMPL(COORD_LOG_LEVEL_WARN,  __VA_ARGS__)
#define LOG_INF(...) LOG_TMPL(COORD_LOG_LEVEL_INFO,  __VA_ARGS__)
#define LOG_DBG(...) LOG_TMPL(COORD_LOG_LEVEL_DEBUG, __VA_ARGS__)
