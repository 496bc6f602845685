#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "parqlint/common/logger.h"

namespace parqlint {

using TimePointClock = std::chrono::time_point<std::chrono::steady_clock>;
using DurationClock = std::chrono::steady_clock::duration;

class ScopedTimerClock {
 public:
  explicit ScopedTimerClock(DurationClock& result) : start_(std::chrono::steady_clock::now()), result_(result) {}
  ~ScopedTimerClock() { result_ += std::chrono::steady_clock::now() - start_; }

  ScopedTimerClock(const ScopedTimerClock&) = delete;
  ScopedTimerClock& operator=(const ScopedTimerClock&) = delete;

 private:
  TimePointClock start_;
  DurationClock& result_;
};

// Reports the elapsed time of a lint/rewrite stage as "metrics:time:<stage>" in microseconds.
class ScopedStageTimer {
 public:
  ScopedStageTimer(LoggerPtr logger, std::string stage)
      : logger_(std::move(logger)), stage_(std::move(stage)), start_(std::chrono::steady_clock::now()) {}

  ~ScopedStageTimer() {
    if (logger_) {
      auto micros = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
      logger_->Log(std::to_string(micros.count()), "metrics:time:" + stage_);
    }
  }

  ScopedStageTimer(const ScopedStageTimer&) = delete;
  ScopedStageTimer& operator=(const ScopedStageTimer&) = delete;

 private:
  LoggerPtr logger_;
  std::string stage_;
  TimePointClock start_;
};

}  // namespace parqlint
