#pragma once

#include <string>

namespace fetters::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use local time while tests use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current local date as YYYY-MM-DD.
  virtual std::string today() = 0;

  // Current local timestamp as YYYY-MM-DD HH:MM:SS.
  virtual std::string now_timestamp() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns the host's local time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::string today() override;
  std::string now_timestamp() override;
};

// Fixed clock: returns a constant timestamp for deterministic tests.
// fixed_timestamp must be formatted YYYY-MM-DD HH:MM:SS.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_timestamp) : fixed_timestamp_(std::move(fixed_timestamp)) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::string today() override;
  std::string now_timestamp() override;

 private:
  std::string fixed_timestamp_;
};

}  // namespace fetters::core
