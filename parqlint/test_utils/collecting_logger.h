#pragma once

#include <string>
#include <utility>
#include <vector>

#include "parqlint/common/logger.h"

namespace parqlint {

// Keeps every message for later inspection.
class CollectingLogger : public ILogger {
 public:
  void Log(const Message& message, const MessageType& message_type) override {
    messages_.emplace_back(message_type, message);
  }

  size_t Count(const MessageType& message_type) const {
    size_t result = 0;
    for (const auto& [type, message] : messages_) {
      result += type == message_type;
    }
    return result;
  }

  std::vector<Message> Messages(const MessageType& message_type) const {
    std::vector<Message> result;
    for (const auto& [type, message] : messages_) {
      if (type == message_type) {
        result.push_back(message);
      }
    }
    return result;
  }

 private:
  std::vector<std::pair<MessageType, Message>> messages_;
};

}  // namespace parqlint
