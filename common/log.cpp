#include "log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <vector>

namespace {

struct log_state {
    std::atomic<int> verbosity{COORD_LOG_LEVEL_INFO};
    std::atomic<bool> prefix{true};
    std::mutex mutex;
    FILE * file = nullptr;

    ~log_state() {
        if (file) {
            fclose(file);
        }
    }
};

log_state & state() {
    static log_state s;
    return s;
}

const char * level_tag(int level) {
    switch (level) {
        case COORD_LOG_LEVEL_ERROR: return "E";
        case COORD_LOG_LEVEL_WARN:  return "W";
        case COORD_LOG_LEVEL_INFO:  return "I";
        case COORD_LOG_LEVEL_DEBUG: return "D";
        default:                    return "?";
    }
}

} // namespace

void coord_log_set_verbosity(int level) {
    state().verbosity = level;
}

int coord_log_get_verbosity() {
    return state().verbosity.load();
}

bool coord_log_set_file(const std::string & path) {
    auto & s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.file) {
        fclose(s.file);
        s.file = nullptr;
    }
    if (path.empty()) {
        return true;
    }

    s.file = fopen(path.c_str(), "a");
    return s.file != nullptr;
}

void coord_log_set_prefix(bool enabled) {
    state().prefix = enabled;
}

void coord_log_write(int level, const char * fmt, ...) {
    auto & s = state();

    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);

    std::vector<char> buf(256);
    int n = vsnprintf(buf.data(), buf.size(), fmt, args);
    if (n >= (int) buf.size()) {
        buf.resize(n + 1);
        vsnprintf(buf.data(), buf.size(), fmt, args_copy);
    }
    va_end(args_copy);
    va_end(args);

    char prefix[64] = {0};
    if (s.prefix) {
        auto now = std::chrono::system_clock::now();
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf;
        localtime_r(&t, &tm_buf);
        char tbuf[32];
        std::strftime(tbuf, sizeof(tbuf), "%H:%M:%S", &tm_buf);
        snprintf(prefix, sizeof(prefix), "%s.%03d %s ", tbuf, (int) ms, level_tag(level));
    }

    std::lock_guard<std::mutex> lock(s.mutex);
    fprintf(stderr, "%s%s", prefix, buf.data());
    fflush(stderr);
    if (s.file) {
        fprintf(s.file, "%s%s", prefix, buf.data());
        fflush(s.file);
    }
}
