#pragma once
#include <cstdint>
#include <functional>

// tiny printf style logger, the sink can be swapped by the host (serial, file, test capture)

namespace swg {

enum class LogLevel : uint8_t {Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4};

using LogSink = std::function<void(LogLevel, const char* line)>;

void set_log_level(LogLevel lvl);
LogLevel log_level();
void set_log_sink(LogSink sink);    //empty sink restores stderr

void log_debug(const char* fmt, ...);
void log_info(const char* fmt, ...);
void log_warn(const char* fmt, ...);
void log_error(const char* fmt, ...);

}   //namespace swg
