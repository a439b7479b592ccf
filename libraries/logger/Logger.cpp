#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Cellvox::Log {

namespace {

std::string FormatClock(std::chrono::system_clock::time_point time)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

std::string_view LogLevelName(LogLevel level)
{
    switch (level) {
        case LogLevel::LOG_DEBUG:    return "DEBUG";
        case LogLevel::LOG_INFO:     return "INFO";
        case LogLevel::LOG_WARNING:  return "WARNING";
        case LogLevel::LOG_ERROR:    return "ERROR";
        case LogLevel::LOG_CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (LogLevel level : {LogLevel::LOG_DEBUG, LogLevel::LOG_INFO, LogLevel::LOG_WARNING,
                           LogLevel::LOG_ERROR, LogLevel::LOG_CRITICAL}) {
        std::string candidate(LogLevelName(level));
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == candidate) {
            return level;
        }
    }
    return std::nullopt;
}

Logger::Logger(const std::string& name, bool enabled)
    : name(name), enabled(enabled)
{
}

void Logger::AddChild(std::shared_ptr<Logger> child)
{
    if (child) {
        children.push_back(std::move(child));
    }
}

void Logger::RemoveChild(Logger* child)
{
    auto it = std::find_if(children.begin(), children.end(),
        [child](const std::shared_ptr<Logger>& ptr) { return ptr.get() == child; });
    if (it != children.end()) {
        children.erase(it);
    }
}

void Logger::Log(LogLevel level, const std::string& message)
{
    if (!enabled || level < minLevel) {
        return;
    }

    entries.push_back(LogEntry{std::chrono::system_clock::now(), level, message});

    if (terminalOutput) {
        std::cout << FormatEntry(entries.back()) << std::endl;
    }
}

size_t Logger::CountEntries(LogLevel atLeast, bool includeChildren) const
{
    size_t count = static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
        [atLeast](const LogEntry& entry) { return entry.level >= atLeast; }));

    if (includeChildren) {
        for (const auto& child : children) {
            count += child->CountEntries(atLeast, true);
        }
    }
    return count;
}

std::string Logger::FormatEntry(const LogEntry& entry) const
{
    std::string line;
    line.reserve(entry.message.size() + name.size() + 32);
    line += "[" + FormatClock(entry.time) + "] ";
    line += "[" + name + "] ";
    line += "[" + std::string(LogLevelName(entry.level)) + "] ";
    line += entry.message;
    return line;
}

std::string Logger::ExtractLogs(int indentLevel) const
{
    const std::string indent(static_cast<size_t>(indentLevel) * 2, ' ');

    std::ostringstream result;
    result << indent << "=== Logger: " << name << " ===\n";
    for (const auto& entry : entries) {
        result << indent << FormatEntry(entry) << "\n";
    }

    for (const auto& child : children) {
        result << "\n" << child->ExtractLogs(indentLevel + 1);
    }
    return result.str();
}

void Logger::ClearAll()
{
    Clear();
    for (auto& child : children) {
        child->ClearAll();
    }
}

} // namespace Cellvox::Log
