#pragma once

#include <chrono>
#include <string>

namespace hmon {

using TimePoint = std::chrono::system_clock::time_point;

// Time source (injected for testability)
class IClock {
public:
  virtual ~IClock() = default;

  virtual TimePoint now() = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public IClock {
public:
  TimePoint now() override;
  void sleep_for(std::chrono::milliseconds duration) override;
};

// UTC, millisecond precision: 2024-05-01T12:00:00.000Z
std::string format_iso8601(TimePoint tp);

} // namespace hmon
