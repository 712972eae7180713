#pragma once
#include "util/common.h++"
#include <algorithm>
#include <compare>

namespace Crystal {

constexpr uint8_t TOTAL_BITS = 63, MIN_TIME_BITS = 40, MAX_TIME_BITS = 48, DEFAULT_TIME_BITS = 42;

// 2020-01-01T00:00:00Z
constexpr int64_t DEFAULT_EPOCH_MS = 1'577'836'800'000;

constexpr size_t ID_BYTES = 8, ID_BASE32_LENGTH = 13, ID_HEX_LENGTH = 16;

// Random sequence starts stay in the lower half of the sequence range
constexpr auto seed_mask_for(uint8_t sequence_bits) noexcept -> uint64_t {
  return sequence_bits <= 1 ? 0 : (uint64_t{1} << (sequence_bits - 1)) - 1;
}

constexpr auto clamp_time_bits(int time_bits) noexcept -> uint8_t {
  if (time_bits < MIN_TIME_BITS) return MIN_TIME_BITS;
  if (time_bits > MAX_TIME_BITS) return MAX_TIME_BITS;
  return static_cast<uint8_t>(time_bits);
}

// How a timestamp offset and a sequence share the 63 usable bits of an ID.
// Nothing in an ID records its layout, so decoding needs the same layout
// that generated it.
class IdLayout {
private:
  int64_t _epoch_ms;
  uint8_t _time_bits;
public:
  constexpr IdLayout(int64_t epoch_ms = DEFAULT_EPOCH_MS, int time_bits = DEFAULT_TIME_BITS) noexcept
    : _epoch_ms(epoch_ms), _time_bits(clamp_time_bits(time_bits)) {}

  constexpr auto epoch_ms() const noexcept -> int64_t { return _epoch_ms; }
  auto epoch() const noexcept -> Timestamp { return ms_to_timestamp(_epoch_ms); }
  constexpr auto time_bits() const noexcept -> uint8_t { return _time_bits; }
  constexpr auto sequence_bits() const noexcept -> uint8_t { return TOTAL_BITS - _time_bits; }
  constexpr auto sequence_mask() const noexcept -> uint64_t {
    return (uint64_t{1} << sequence_bits()) - 1;
  }
  constexpr auto seed_mask() const noexcept -> uint64_t { return seed_mask_for(sequence_bits()); }
  constexpr auto offset_mask() const noexcept -> uint64_t {
    return (uint64_t{1} << _time_bits) - 1;
  }

  // Milliseconds since this layout's epoch, never negative
  constexpr auto offset_of(int64_t unix_ms) const noexcept -> uint64_t {
    return unix_ms <= _epoch_ms ? 0 : static_cast<uint64_t>(unix_ms - _epoch_ms);
  }
  constexpr auto pack(uint64_t offset, uint64_t sequence) const noexcept -> int64_t {
    return static_cast<int64_t>(
      ((offset & offset_mask()) << sequence_bits()) | (sequence & sequence_mask())
    );
  }
  constexpr auto offset_of_id(int64_t id) const noexcept -> uint64_t {
    return static_cast<uint64_t>(id) >> sequence_bits();
  }
  constexpr auto sequence_of_id(int64_t id) const noexcept -> uint64_t {
    return static_cast<uint64_t>(id) & sequence_mask();
  }
  constexpr auto timestamp_ms_of_id(int64_t id) const noexcept -> int64_t {
    return static_cast<int64_t>(offset_of_id(id)) + _epoch_ms;
  }

  constexpr bool operator==(const IdLayout&) const noexcept = default;
};

class Id {
private:
  int64_t _value;
public:
  constexpr Id() noexcept : _value(0) {}
  constexpr explicit Id(int64_t value) noexcept : _value(value) {}

  constexpr auto to_int64() const noexcept -> int64_t { return _value; }
  auto to_bytes() const noexcept -> std::array<uint8_t, ID_BYTES>;

  // Always ID_BASE32_LENGTH characters
  auto base32() const -> std::string;
  // Always ID_HEX_LENGTH characters, lowercase
  auto hex() const -> std::string;
  auto to_string() const -> std::string { return base32(); }

  auto time(const IdLayout& layout = {}) const noexcept -> Timestamp {
    return ms_to_timestamp(layout.timestamp_ms_of_id(_value));
  }
  auto sequence(const IdLayout& layout = {}) const noexcept -> uint64_t {
    return layout.sequence_of_id(_value);
  }

  static constexpr auto from_int64(int64_t value) noexcept -> Id { return Id(value); }
  static auto from_bytes(std::string_view bytes) -> Id;
  // Both throw DecodeError
  static auto from_base32(std::string_view str) -> Id;
  static auto from_hex(std::string_view str) -> Id;
  static auto from_string(std::string_view str) -> Id { return from_base32(str); }
  // All digits: decimal int64; otherwise hex at ID_HEX_LENGTH characters,
  // else base32. Throws DecodeError.
  static auto from_any(std::string_view str) -> Id;

  constexpr auto operator<=>(const Id&) const noexcept = default;
};

}

template <> struct std::hash<Crystal::Id> {
  auto operator()(const Crystal::Id& id) const noexcept -> size_t {
    return std::hash<int64_t>{}(id.to_int64());
  }
};

namespace fmt {
  template <> struct formatter<Crystal::Id> : public Crystal::CustomFormatter {
    template <typename FormatContext>
    auto format(const Crystal::Id& id, FormatContext& ctx) const {
      const auto s = id.base32();
      return std::copy(s.begin(), s.end(), ctx.out());
    }
  };
}
