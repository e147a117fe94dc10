#pragma once

#include <memory>
#include <string>
#include "Logger.h"

/**
 * @brief Logging macros for ILoggable-derived classes
 *
 * These macros check that the logger exists before calling it.
 *
 * Available macros:
 * - OCTAVIEW_LOG_DEBUG(msg)
 * - OCTAVIEW_LOG_INFO(msg)
 * - OCTAVIEW_LOG_WARNING(msg)
 * - OCTAVIEW_LOG_ERROR(msg)
 */
#define OCTAVIEW_LOG_DEBUG(msg)   do { if (auto* log = GetLogger()) { log->Debug(msg); } } while(0)
#define OCTAVIEW_LOG_INFO(msg)    do { if (auto* log = GetLogger()) { log->Info(msg); } } while(0)
#define OCTAVIEW_LOG_WARNING(msg) do { if (auto* log = GetLogger()) { log->Warning(msg); } } while(0)
#define OCTAVIEW_LOG_ERROR(msg)   do { if (auto* log = GetLogger()) { log->Error(msg); } } while(0)

namespace Octaview::Log {

/**
 * @brief Mixin for components that own a named logger
 *
 * Usage pattern:
 * @code
 * class SliceSampler : public ILoggable {
 * public:
 *     SliceSampler() { InitializeLogger("SliceSampler"); }
 *
 *     void sample() {
 *         OCTAVIEW_LOG_DEBUG("Sampling slice...");
 *     }
 * };
 * @endcode
 */
class ILoggable {
public:
    virtual ~ILoggable() = default;

    /**
     * @brief Get the component's logger
     * @return Logger pointer (nullptr if InitializeLogger was never called)
     */
    Logger* GetLogger() const { return logger.get(); }

    /**
     * @brief Register this component's logger as a child of a parent logger
     * @param parentLogger Parent logger (typically the application logger)
     */
    void RegisterToParentLogger(Logger* parentLogger);

    /**
     * @brief Deregister this component's logger from its parent
     */
    void DeregisterFromParentLogger(Logger* parentLogger);

    void SetLoggerEnabled(bool enabled);

    /**
     * @brief Enable/disable terminal output for this component's logger
     * @param enabled True to print logs to console in real-time
     */
    void SetLoggerTerminalOutput(bool enabled);

protected:
    /**
     * @brief Initialize the logger with a component name
     * @param subsystemName Name for this component's logger (e.g. "SliceSampler")
     * @param enabled Initial enabled state (default: false)
     *
     * Call this in the derived class constructor
     */
    void InitializeLogger(const std::string& subsystemName, bool enabled = false);

private:
    std::shared_ptr<Logger> logger;
};

} // namespace Octaview::Log
