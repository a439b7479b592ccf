#pragma once

#include <memory>
#include <string>
#include "Logger.h"

/**
 * @brief Logging macros for ILoggable-derived classes
 *
 * The logger is optional; these expand to nothing observable when the
 * subsystem never called InitializeLogger().
 */
#define LOG_DEBUG(msg)   do { if (auto* log = GetLogger()) { log->Debug(msg); } } while(0)
#define LOG_INFO(msg)    do { if (auto* log = GetLogger()) { log->Info(msg); } } while(0)
#define LOG_WARNING(msg) do { if (auto* log = GetLogger()) { log->Warning(msg); } } while(0)
#define LOG_ERROR(msg)   do { if (auto* log = GetLogger()) { log->Error(msg); } } while(0)

namespace Cellvox::Log {

/**
 * @brief Mixin for subsystems that own a named logger
 *
 * Usage pattern:
 * @code
 * class ChunkStorageCoordinator : public ILoggable {
 * public:
 *     ChunkStorageCoordinator() { InitializeLogger("ChunkStorage"); }
 *
 *     void grow() {
 *         LOG_INFO("Allocated group 2");
 *     }
 * };
 * @endcode
 */
class ILoggable {
public:
    virtual ~ILoggable() = default;

    /**
     * @brief Get the subsystem's logger
     * @return Logger pointer (may be nullptr if not initialized)
     */
    Logger* GetLogger() const { return logger.get(); }

    /**
     * @brief Attach this subsystem's logger under a parent logger
     * @param parentLogger Parent logger (typically the residency manager's)
     */
    void RegisterToParentLogger(Logger* parentLogger);

    /**
     * @brief Detach this subsystem's logger from its parent
     */
    void DeregisterFromParentLogger(Logger* parentLogger);

    void SetLoggerEnabled(bool enabled);
    void SetLoggerTerminalOutput(bool enabled);
    void SetLoggerMinLevel(LogLevel level);

protected:
    /**
     * @brief Create the logger with a subsystem name
     *
     * Call this in the derived class constructor.
     */
    void InitializeLogger(const std::string& subsystemName, bool enabled = false);

private:
    std::shared_ptr<Logger> logger;
};

} // namespace Cellvox::Log
