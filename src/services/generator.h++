#pragma once
#include "util/common.h++"
#include "models/id.h++"
#include <mutex>

namespace Crystal {
  using Seed = Sha256;

  struct GeneratorConfig {
    int64_t epoch_ms = DEFAULT_EPOCH_MS;
    // Clamped to [MIN_TIME_BITS, MAX_TIME_BITS] when the generator is built
    int time_bits = DEFAULT_TIME_BITS;
    // Replace the host name and process ID that the seed is derived from
    std::optional<std::string> machine = {};
    std::optional<int64_t> pid = {};
    // Defaults to the system clock when empty
    MillisClock clock = {};

    auto layout() const noexcept -> IdLayout { return IdLayout(epoch_ms, time_bits); }
  };

  // Produces strictly increasing IDs from a millisecond timestamp and a
  // per-millisecond sequence. The configuration is captured at construction
  // and never changes afterwards. generate() may be called from any thread.
  class Generator {
  private:
    const IdLayout _layout;
    const MillisClock clock;
    const std::string _machine;
    const int64_t _pid;
    const Seed _seed;

    std::mutex mx;
    uint64_t last_timestamp;
    uint64_t sequence;

    auto now_offset() const -> uint64_t {
      return _layout.offset_of(clock());
    }
  public:
    explicit Generator(GeneratorConfig config = {});
    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    auto generate() -> Id;

    auto layout() const noexcept -> const IdLayout& { return _layout; }
    auto epoch() const noexcept -> Timestamp { return _layout.epoch(); }
    auto machine() const noexcept -> std::string_view { return _machine; }
    auto pid() const noexcept -> int64_t { return _pid; }
    auto seed() const noexcept -> const Seed& { return _seed; }

    static auto derive_seed(std::string_view machine, int64_t pid) -> Seed;

    // Random starting sequence for a new millisecond, at most
    // 2^(sequence_bits - 1) - 1 and 0 when sequence_bits <= 1
    static auto init_counter(const Seed& seed, uint8_t sequence_bits) -> uint64_t;

    // Used by init_counter when no randomness is available
    static auto fallback_counter(const Seed& seed, uint8_t sequence_bits, uint64_t ns) noexcept -> uint64_t;
  };
}
