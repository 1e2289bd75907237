#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace voxquad::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);

// Reads VOXQUAD_LOG_LEVEL once per process. Later calls are no-ops.
void initializeLogLevelFromEnvironment();

// Accepts level names ("warn", "warning", ...) or digits 0..4.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);
[[nodiscard]] const char* logLevelName(LogLevel level);

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

} // namespace voxquad::core

#define VQ_LOG_STREAM(level, category) \
    if (!::voxquad::core::shouldLog(level)) {} else ::voxquad::core::LogLine((level), (category)).stream()

#define VQ_LOGE(category) VQ_LOG_STREAM(::voxquad::core::LogLevel::Error, (category))
#define VQ_LOGW(category) VQ_LOG_STREAM(::voxquad::core::LogLevel::Warn, (category))
#define VQ_LOGI(category) VQ_LOG_STREAM(::voxquad::core::LogLevel::Info, (category))
#define VQ_LOGD(category) VQ_LOG_STREAM(::voxquad::core::LogLevel::Debug, (category))
#define VQ_LOGT(category) VQ_LOG_STREAM(::voxquad::core::LogLevel::Trace, (category))
