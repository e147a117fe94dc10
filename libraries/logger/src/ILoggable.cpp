#include "ILoggable.h"
#include "Logger.h"

namespace Octaview::Log {

void ILoggable::InitializeLogger(const std::string& subsystemName, bool enabled) {
    logger = std::make_shared<Logger>(subsystemName, enabled);
}

void ILoggable::RegisterToParentLogger(Logger* parentLogger) {
    if (parentLogger && logger) {
        parentLogger->AddChild(logger);
    }
}

void ILoggable::DeregisterFromParentLogger(Logger* parentLogger) {
    if (parentLogger && logger) {
        parentLogger->RemoveChild(logger.get());
    }
}

void ILoggable::SetLoggerEnabled(bool enabled) {
    if (logger) {
        logger->SetEnabled(enabled);
    }
}

void ILoggable::SetLoggerTerminalOutput(bool enabled) {
    if (logger) {
        logger->SetTerminalOutput(enabled);
    }
}

} // namespace Octaview::Log
