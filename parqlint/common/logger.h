#pragma once

#include <memory>
#include <string>

namespace parqlint {

// Message types are colon-separated tags, e.g. "metrics:io:requests" or "degraded:sampling".
class ILogger {
 public:
  using Message = std::string;
  using MessageType = std::string;

  virtual void Log(const Message& message, const MessageType& message_type) = 0;

  virtual ~ILogger() = default;
};

using LoggerPtr = std::shared_ptr<ILogger>;

// Does nothing without a logger.
inline void Log(const LoggerPtr& logger, const ILogger::Message& message, const ILogger::MessageType& message_type) {
  if (logger) {
    logger->Log(message, message_type);
  }
}

}  // namespace parqlint
