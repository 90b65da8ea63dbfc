#pragma once

#include "sfid/core/result.h"

#include <cstdint>
#include <mutex>
#include <random>

namespace sfid::core {

// Abstract random source for dependency injection.
// Production code draws from per-thread engines; tests/demos use a seeded engine
// so generated identifiers are reproducible.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Draw a uniformly distributed integer in the inclusive range [lo, hi].
  // Contract: lo <= hi, otherwise SnowflakeError::kRandomSource.
  // Implementations must be safe to call concurrently from several threads.
  [[nodiscard]] virtual Result<std::uint64_t, SnowflakeError> next_in_range(std::uint64_t lo,
                                                                             std::uint64_t hi) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production source: each calling thread owns a std::mt19937_64 seeded from
// std::random_device on first use. Stateless from the caller's point of view;
// concurrent callers never share an engine.
class ThreadLocalRandomSource final : public IRandomSource {
 public:
  ThreadLocalRandomSource() = default;
  ~ThreadLocalRandomSource() override = default;

  ThreadLocalRandomSource(const ThreadLocalRandomSource&) = default;
  ThreadLocalRandomSource& operator=(const ThreadLocalRandomSource&) = default;
  ThreadLocalRandomSource(ThreadLocalRandomSource&&) = default;
  ThreadLocalRandomSource& operator=(ThreadLocalRandomSource&&) = default;

  [[nodiscard]] Result<std::uint64_t, SnowflakeError> next_in_range(std::uint64_t lo,
                                                                     std::uint64_t hi) override;
};

// Deterministic source: one seeded std::mt19937_64 shared behind a mutex.
// Same seed and same sequence of calls produce the same values.
class DeterministicRandomSource final : public IRandomSource {
 public:
  explicit DeterministicRandomSource(std::uint64_t seed) : engine_(seed) {}
  ~DeterministicRandomSource() override = default;

  // Not copyable or movable (contains mutex)
  DeterministicRandomSource(const DeterministicRandomSource&) = delete;
  DeterministicRandomSource& operator=(const DeterministicRandomSource&) = delete;
  DeterministicRandomSource(DeterministicRandomSource&&) = delete;
  DeterministicRandomSource& operator=(DeterministicRandomSource&&) = delete;

  [[nodiscard]] Result<std::uint64_t, SnowflakeError> next_in_range(std::uint64_t lo,
                                                                     std::uint64_t hi) override;

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

}  // namespace sfid::core
