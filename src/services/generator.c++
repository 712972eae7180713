#include "generator.h++"
#include <errno.h>
#include <limits.h>
#include <unistd.h>
#include <thread>

using std::lock_guard, std::mutex, std::optional, std::string, std::string_view;

namespace Crystal {
  static auto resolve_machine(optional<string> machine) -> string {
    if (machine) return std::move(*machine);
    char hostname[HOST_NAME_MAX + 1] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1)) {
      spdlog::warn("Could not read host name ({}), seeding with \"unknown\"", strerror(errno));
      return "unknown";
    }
    return string(hostname);
  }

  Generator::Generator(GeneratorConfig config)
    : _layout(config.layout()),
      clock(config.clock ? std::move(config.clock) : MillisClock(now_ms)),
      _machine(resolve_machine(std::move(config.machine))),
      _pid(config.pid.value_or(static_cast<int64_t>(getpid()))),
      _seed(derive_seed(_machine, _pid)),
      last_timestamp(now_offset()),
      sequence(init_counter(_seed, _layout.sequence_bits()))
  {
    spdlog::debug(
      "ID generator ready: epoch {} ms, {} time bits, {} sequence bits, machine {}, pid {}",
      _layout.epoch_ms(), _layout.time_bits(), _layout.sequence_bits(), _machine, _pid
    );
  }

  auto Generator::derive_seed(string_view machine, int64_t pid) -> Seed {
    return sha256({ machine, std::to_string(pid) });
  }

  auto Generator::fallback_counter(const Seed& seed, uint8_t sequence_bits, uint64_t ns) noexcept -> uint64_t {
    return (ns ^ read_uint64_be(seed.data() + seed.size() - sizeof(uint64_t))) & seed_mask_for(sequence_bits);
  }

  auto Generator::init_counter(const Seed& seed, uint8_t sequence_bits) -> uint64_t {
    if (sequence_bits <= 1) return 0;
    uint8_t random[32];
    if (RAND_bytes(random, sizeof(random)) != 1) {
      spdlog::warn("Not enough randomness to seed ID sequence, falling back to clock");
      return fallback_counter(seed, sequence_bits, now_ns());
    }
    try {
      const auto hash = sha256({
        as_string_view(seed.data(), seed.size()),
        as_string_view(random, sizeof(random))
      });
      return read_uint64_be(hash.data()) & seed_mask_for(sequence_bits);
    } catch (const std::runtime_error& e) {
      spdlog::warn("Could not hash ID sequence seed, falling back to clock: {}", e.what());
      return fallback_counter(seed, sequence_bits, now_ns());
    }
  }

  auto Generator::generate() -> Id {
    auto now = now_offset();
    lock_guard<mutex> guard(mx);

    if (now < last_timestamp) {
      spdlog::debug("Clock is {} ms behind last ID, holding timestamp", last_timestamp - now);
      now = last_timestamp;
    }

    if (now == last_timestamp) {
      sequence = (sequence + 1) & _layout.sequence_mask();
      if (sequence == 0) {
        spdlog::debug("ID sequence exhausted at offset {}, waiting for next millisecond", last_timestamp);
        while (now <= last_timestamp) {
          std::this_thread::yield();
          now = now_offset();
        }
        sequence = init_counter(_seed, _layout.sequence_bits());
      }
    } else {
      sequence = init_counter(_seed, _layout.sequence_bits());
    }

    last_timestamp = now;
    return Id(_layout.pack(now, sequence));
  }
}
