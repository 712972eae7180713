#include "id.h++"
#include "util/base32.h++"
#include "util/hex.h++"
#include <algorithm>
#include <charconv>

using std::array, std::string, std::string_view;

namespace Crystal {

auto Id::to_bytes() const noexcept -> array<uint8_t, ID_BYTES> {
  array<uint8_t, ID_BYTES> bytes;
  write_uint64_be(static_cast<uint64_t>(_value), bytes.data());
  return bytes;
}

auto Id::base32() const -> string {
  const auto bytes = to_bytes();
  return Base32::encode(bytes.data(), bytes.size());
}

auto Id::hex() const -> string {
  return fmt::format("{:016x}", static_cast<uint64_t>(_value));
}

auto Id::from_bytes(string_view bytes) -> Id {
  if (bytes.length() != ID_BYTES) {
    throw DecodeError(
      DecodeError::Kind::WrongLength,
      fmt::format("ID must decode to {} bytes, got {}", ID_BYTES, bytes.length()),
      bytes.length()
    );
  }
  return Id(static_cast<int64_t>(read_uint64_be(reinterpret_cast<const uint8_t*>(bytes.data()))));
}

auto Id::from_base32(string_view str) -> Id {
  try {
    return from_bytes(Base32::decode(str));
  } catch (const DecodeError& e) {
    spdlog::debug("Rejected base32 ID ({} chars): {}", str.length(), e.what());
    throw;
  }
}

auto Id::from_hex(string_view str) -> Id {
  try {
    return from_bytes(Hex::decode(str));
  } catch (const DecodeError& e) {
    spdlog::debug("Rejected hex ID ({} chars): {}", str.length(), e.what());
    throw;
  }
}

auto Id::from_any(string_view str) -> Id {
  const bool digits = !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return c >= '0' && c <= '9'; });
  if (digits) {
    int64_t n;
    const auto res = std::from_chars(str.data(), str.data() + str.length(), n, 10);
    if (res.ec == std::errc{} && res.ptr == str.data() + str.length()) return from_int64(n);
    throw DecodeError(
      DecodeError::Kind::Malformed,
      fmt::format("decimal ID {} does not fit in 63 bits", str),
      str.length()
    );
  }
  if (str.length() == ID_HEX_LENGTH) return from_hex(str);
  return from_base32(str);
}

}
