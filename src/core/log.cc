#include "core/log.h"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace voxquad::core {
namespace {

struct LevelSpelling {
    LogLevel level;
    std::string_view name;
    std::string_view alias;
    char digit;
};

// First entry of each level is the canonical name printed in log lines.
constexpr std::array<LevelSpelling, 5> kLevelSpellings = {{
    {LogLevel::Error, "error", "err", '0'},
    {LogLevel::Warn, "warn", "warning", '1'},
    {LogLevel::Info, "info", "", '2'},
    {LogLevel::Debug, "debug", "", '3'},
    {LogLevel::Trace, "trace", "", '4'},
}};

std::atomic<LogLevel> g_threshold{LogLevel::Info};
std::once_flag g_environmentRead;
std::mutex g_sinkMutex;

bool equalsIgnoringCase(std::string_view text, std::string_view lowerCaseWord) {
    if (lowerCaseWord.empty() || text.size() != lowerCaseWord.size()) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
        if (c != lowerCaseWord[i]) {
            return false;
        }
    }
    return true;
}

// HH:MM:SS.mmm in local time.
void streamClock(std::ostream& out) {
    using Clock = std::chrono::system_clock;
    const Clock::time_point now = Clock::now();
    const long long millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = Clock::to_time_t(now);

    std::tm wallClock{};
#if defined(_WIN32)
    localtime_s(&wallClock, &seconds);
#else
    localtime_r(&seconds, &wallClock);
#endif
    out << std::put_time(&wallClock, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
}

bool goesToErrorStream(LogLevel level) {
    return level == LogLevel::Error || level == LogLevel::Warn;
}

} // namespace

const char* logLevelName(LogLevel level) {
    for (const LevelSpelling& spelling : kLevelSpellings) {
        if (spelling.level == level) {
            return spelling.name.data();
        }
    }
    return "info";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    for (const LevelSpelling& spelling : kLevelSpellings) {
        const bool digitMatch = text.size() == 1 && text.front() == spelling.digit;
        if (digitMatch || equalsIgnoringCase(text, spelling.name) || equalsIgnoringCase(text, spelling.alias)) {
            return spelling.level;
        }
    }
    return std::nullopt;
}

void setLogLevel(LogLevel level) {
    g_threshold.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() {
    initializeLogLevelFromEnvironment();
    return g_threshold.load(std::memory_order_relaxed);
}

bool shouldLog(LogLevel level) {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(logLevel());
}

void initializeLogLevelFromEnvironment() {
    std::call_once(g_environmentRead, [] {
        const char* value = std::getenv("VOXQUAD_LOG_LEVEL");
        if (value == nullptr) {
            return;
        }
        if (const std::optional<LogLevel> level = parseLogLevel(value)) {
            g_threshold.store(*level, std::memory_order_relaxed);
        }
    });
}

LogLine::LogLine(LogLevel level, std::string_view category)
    : m_level(level), m_category(category) {}

LogLine::~LogLine() {
    std::string message = m_stream.str();
    const std::size_t end = message.find_last_not_of("\r\n");
    message.resize(end == std::string::npos ? 0 : end + 1);

    // Info lines carry no level tag; everything else is tagged after the category.
    std::ostringstream line;
    line << '[';
    streamClock(line);
    line << ']';
    if (!m_category.empty()) {
        line << '[' << m_category << ']';
    }
    if (m_level != LogLevel::Info) {
        line << '[' << logLevelName(m_level) << ']';
    }
    line << ' ' << message << '\n';

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    std::ostream& sink = goesToErrorStream(m_level) ? std::cerr : std::cout;
    sink << line.str();
}

std::ostream& LogLine::stream() {
    return m_stream;
}

} // namespace voxquad::core
