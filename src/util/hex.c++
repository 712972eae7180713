#include "hex.h++"
#include <iterator>
#include <fmt/format.h>

using Crystal::DecodeError;
using std::string, std::string_view;

namespace Hex {
  static inline auto nibble(char c) noexcept -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  auto encode(const uint8_t* data, size_t len) -> string {
    string ret;
    ret.reserve(len * 2);
    for (size_t i = 0; i < len; i++) fmt::format_to(std::back_inserter(ret), "{:02x}", data[i]);
    return ret;
  }

  auto decode(string_view input, string& out) -> size_t {
    const auto in_len = input.length();
    // Bad characters take precedence over a bad length
    for (size_t i = 0; i < in_len; i++) {
      if (nibble(input[i]) < 0) {
        throw DecodeError(
          DecodeError::Kind::Malformed,
          fmt::format("invalid hex byte {:#04x} at input byte {}", static_cast<uint8_t>(input[i]), i),
          in_len
        );
      }
    }
    if (in_len % 2) {
      throw DecodeError(DecodeError::Kind::Malformed, "odd length hex string", in_len);
    }
    out.resize(in_len / 2);
    for (size_t i = 0; i < out.length(); i++) {
      out[i] = static_cast<char>((nibble(input[i * 2]) << 4) | nibble(input[i * 2 + 1]));
    }
    return out.length();
  }

  auto decode(string_view input) -> string {
    string out;
    decode(input, out);
    return out;
  }
}
