#include "sfid/core/random_source.h"

#include <array>
#include <exception>

namespace sfid::core {

namespace {

using RandomResult = Result<std::uint64_t, SnowflakeError>;

std::mt19937_64 make_seeded_engine() {
  // The engine state is state_size 64-bit words; random_device yields 32 bits per call.
  std::random_device device;
  std::array<std::random_device::result_type, 2 * std::mt19937_64::state_size> seed_data{};
  for (auto& word : seed_data) {
    word = device();
  }
  std::seed_seq seq(seed_data.begin(), seed_data.end());
  return std::mt19937_64(seq);
}

std::uint64_t draw(std::mt19937_64& engine, const std::uint64_t lo, const std::uint64_t hi) {
  std::uniform_int_distribution<std::uint64_t> distribution(lo, hi);
  return distribution(engine);
}

}  // namespace

RandomResult ThreadLocalRandomSource::next_in_range(const std::uint64_t lo,
                                                    const std::uint64_t hi) {
  if (lo > hi) {
    return RandomResult::err(SnowflakeError::kRandomSource);
  }

  // std::random_device reports an unavailable entropy source by throwing.
  // A failed initialization is retried on the thread's next call.
  try {
    thread_local std::mt19937_64 engine = make_seeded_engine();
    return RandomResult::ok(draw(engine, lo, hi));
  } catch (const std::exception&) {
    return RandomResult::err(SnowflakeError::kRandomSource);
  }
}

RandomResult DeterministicRandomSource::next_in_range(const std::uint64_t lo,
                                                      const std::uint64_t hi) {
  if (lo > hi) {
    return RandomResult::err(SnowflakeError::kRandomSource);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  return RandomResult::ok(draw(engine_, lo, hi));
}

}  // namespace sfid::core
