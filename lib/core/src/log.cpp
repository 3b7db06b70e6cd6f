#include "swg/log.hpp"
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>

namespace swg {

namespace {

std::mutex g_log_mu;                    //sink may be called from the timer and sample contexts
LogLevel g_level = LogLevel::Info;
LogSink g_sink;

const char* level_tag(LogLevel lvl){
    switch (lvl)
    {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    default: return "";
    }
}

void vlog(LogLevel lvl, const char* fmt, va_list args){
    std::lock_guard<std::mutex> lock(g_log_mu);
    if (lvl < g_level) return;

    char msg[256];
    std::vsnprintf(msg, sizeof(msg), fmt, args);    //truncates long lines

    char line[288];
    std::snprintf(line, sizeof(line), "[swg] %s %s", level_tag(lvl), msg);

    if (g_sink) g_sink(lvl, line);
    else        std::fprintf(stderr, "%s\n", line);
}

}   //namespace

void set_log_level(LogLevel lvl){
    std::lock_guard<std::mutex> lock(g_log_mu);
    g_level = lvl;
}

LogLevel log_level(){
    std::lock_guard<std::mutex> lock(g_log_mu);
    return g_level;
}

void set_log_sink(LogSink sink){
    std::lock_guard<std::mutex> lock(g_log_mu);
    g_sink = std::move(sink);
}

#define SWG_LOG_FN(name, lvl)                   \
    void name(const char* fmt, ...){            \
        va_list args;                           \
        va_start(args, fmt);                    \
        vlog(lvl, fmt, args);                   \
        va_end(args);                           \
    }

SWG_LOG_FN(log_debug, LogLevel::Debug)
SWG_LOG_FN(log_info, LogLevel::Info)
SWG_LOG_FN(log_warn, LogLevel::Warn)
SWG_LOG_FN(log_error, LogLevel::Error)

#undef SWG_LOG_FN

}   //namespace swg
