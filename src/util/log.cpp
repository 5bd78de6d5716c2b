#include <kiln/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#include <unistd.h>

namespace kiln::log {

namespace {

struct LevelStyle {
    Level level;
    const char* name;
    const char* color;
};

const LevelStyle STYLES[] = {
    {Trace, "trace", "\033[90m"},
    {Debug, "debug", "\033[36m"},
    {Info,  "info",  "\033[32m"},
    {Warn,  "warn",  "\033[33m"},
    {Error, "error", "\033[31m"},
};

const LevelStyle& style_of(Level lvl) {
    for (const auto& s : STYLES) {
        if (s.level == lvl) return s;
    }
    return STYLES[Info];
}

// color_mode: -1 undecided, 0 off, 1 on
struct State {
    std::atomic<Level> level{Info};
    std::atomic<int> color_mode{-1};
    std::mutex write_mutex;
};

State& state() {
    static State s;
    return s;
}

bool color_on() {
    auto& st = state();
    int mode = st.color_mode.load();
    if (mode < 0) {
        int detected = isatty(fileno(stderr)) ? 1 : 0;
        st.color_mode.compare_exchange_strong(mode, detected);
        mode = st.color_mode.load();
    }
    return mode == 1;
}

void emit(Level lvl, const char* fmt, va_list args) {
    auto& st = state();
    if (lvl < st.level.load()) return;

    char line[2048];
    std::vsnprintf(line, sizeof(line), fmt, args);

    const LevelStyle& style = style_of(lvl);
    bool color = color_on();
    std::lock_guard<std::mutex> lock(st.write_mutex);
    if (color) {
        std::fprintf(stderr, "%s%s\033[0m: %s\n", style.color, style.name, line);
    } else {
        std::fprintf(stderr, "%s: %s\n", style.name, line);
    }
}

} // namespace

void set_level(Level lvl) { state().level = lvl; }
Level get_level() { return state().level; }

Result<Level> parse_level(const std::string& name) {
    for (const auto& s : STYLES) {
        if (name == s.name) return Result<Level>::ok(s.level);
    }
    return KilnError{KilnError::Config, "unknown log level '" + name + "'",
                     "expected one of: trace, debug, info, warn, error"};
}

const char* level_name(Level lvl) { return style_of(lvl).name; }

void set_color_enabled(bool enabled) { state().color_mode = enabled ? 1 : 0; }
bool is_color_enabled() { return color_on(); }

#define KILN_LOG_ENTRY(fn, lvl)         \
    void fn(const char* fmt, ...) {     \
        va_list args;                   \
        va_start(args, fmt);            \
        emit(lvl, fmt, args);           \
        va_end(args);                   \
    }

KILN_LOG_ENTRY(trace, Trace)
KILN_LOG_ENTRY(debug, Debug)
KILN_LOG_ENTRY(info, Info)
KILN_LOG_ENTRY(warn, Warn)
KILN_LOG_ENTRY(error, Error)

#undef KILN_LOG_ENTRY

} // namespace kiln::log
