#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

// Core Log subsystem
// Responsible for: leveled, categorized diagnostic lines for the loader and its host.
// Should NOT do: carry load errors; those travel through LoadError return values.
namespace voxscene::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

// Receives every emitted line instead of stdout/stderr when installed.
using LogSink = std::function<void(LogLevel level, std::string_view category, std::string_view message)>;

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);
void initializeLogLevelFromEnvironment();
[[nodiscard]] const char* logLevelName(LogLevel level);

// Passing an empty sink restores console output.
void setLogSink(LogSink sink);

class LogLine {
public:
    LogLine(LogLevel level, std::string_view category);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    [[nodiscard]] std::ostream& stream();

private:
    LogLevel m_level;
    std::string m_category;
    std::ostringstream m_stream;
};

} // namespace voxscene::core

#define VOXSCENE_LOG_STREAM(level, category) \
    if (!::voxscene::core::shouldLog(level)) {} else ::voxscene::core::LogLine((level), (category)).stream()

#define VOXSCENE_LOGE(category) VOXSCENE_LOG_STREAM(::voxscene::core::LogLevel::Error, (category))
#define VOXSCENE_LOGW(category) VOXSCENE_LOG_STREAM(::voxscene::core::LogLevel::Warn, (category))
#define VOXSCENE_LOGI(category) VOXSCENE_LOG_STREAM(::voxscene::core::LogLevel::Info, (category))
#define VOXSCENE_LOGD(category) VOXSCENE_LOG_STREAM(::voxscene::core::LogLevel::Debug, (category))
#define VOXSCENE_LOGT(category) VOXSCENE_LOG_STREAM(::voxscene::core::LogLevel::Trace, (category))
