#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Cellvox::Log {

enum class LogLevel {
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARNING,
    LOG_ERROR,
    LOG_CRITICAL
};

std::string_view LogLevelName(LogLevel level);

/**
 * @brief Parse a level name ("debug", "info", "warning", "error", "critical")
 * @return Matching level, or nullopt for unknown names (case-insensitive)
 */
std::optional<LogLevel> ParseLogLevel(const std::string& name);

struct LogEntry {
    std::chrono::system_clock::time_point time;
    LogLevel level = LogLevel::LOG_INFO;
    std::string message;
};

/**
 * @brief Named in-memory logger with child loggers
 *
 * Entries are kept structured and rendered on demand as
 * "[HH:MM:SS.mmm] [name] [LEVEL] message".
 */
class Logger {
public:
    explicit Logger(const std::string& name, bool enabled = false);
    virtual ~Logger() = default;

    // Enable/disable logging
    void SetEnabled(bool enabled) { this->enabled = enabled; }
    bool IsEnabled() const { return enabled; }

    // Entries below this level are dropped
    void SetMinLevel(LogLevel level) { minLevel = level; }
    LogLevel GetMinLevel() const { return minLevel; }

    // Echo each accepted entry to stdout as well
    void SetTerminalOutput(bool enable) { terminalOutput = enable; }
    bool HasTerminalOutput() const { return terminalOutput; }

    // Hierarchical logging (shared ownership keeps children alive while attached)
    void AddChild(std::shared_ptr<Logger> child);
    void RemoveChild(Logger* child);
    const std::vector<std::shared_ptr<Logger>>& GetChildren() const { return children; }

    // Logging methods
    void Log(LogLevel level, const std::string& message);
    void Debug(const std::string& message) { Log(LogLevel::LOG_DEBUG, message); }
    void Info(const std::string& message) { Log(LogLevel::LOG_INFO, message); }
    void Warning(const std::string& message) { Log(LogLevel::LOG_WARNING, message); }
    void Error(const std::string& message) { Log(LogLevel::LOG_ERROR, message); }
    void Critical(const std::string& message) { Log(LogLevel::LOG_CRITICAL, message); }

    // Inspection
    const std::vector<LogEntry>& GetEntries() const { return entries; }
    size_t GetEntryCount() const { return entries.size(); }

    /**
     * @brief Count entries at or above a level
     * @param includeChildren Also count entries of the whole child tree
     */
    size_t CountEntries(LogLevel atLeast, bool includeChildren = false) const;

    std::string FormatEntry(const LogEntry& entry) const;

    // Render this logger and its children, children indented one level deeper
    std::string ExtractLogs(int indentLevel = 0) const;

    // Clear logs
    void Clear() { entries.clear(); }
    void ClearAll(); // Clear this logger and all children
    void ClearChildren() { children.clear(); }

    const std::string& GetName() const { return name; }

protected:
    std::string name;
    bool enabled;
    bool terminalOutput = false;
    LogLevel minLevel = LogLevel::LOG_DEBUG;
    std::vector<std::shared_ptr<Logger>> children;
    std::vector<LogEntry> entries;
};

} // namespace Cellvox::Log
