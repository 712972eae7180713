#include "base32.h++"

using Crystal::DecodeError;
using std::string, std::string_view;

namespace Base32 {
  static constexpr uint8_t INVALID = 0xff;

  static constexpr auto make_decoding_table() -> std::array<uint8_t, 256> {
    std::array<uint8_t, 256> table{};
    for (auto& x : table) x = INVALID;
    for (uint8_t i = 0; i < ALPHABET.length(); i++) {
      table[static_cast<uint8_t>(ALPHABET[i])] = i;
    }
    return table;
  }

  static constexpr auto DECODING_TABLE = make_decoding_table();

  auto encode(const uint8_t* data, size_t len) -> string {
    string ret;
    ret.reserve(encoded_length(len));
    uint32_t buffer = 0;
    uint8_t bits = 0;
    for (size_t i = 0; i < len; i++) {
      buffer = (buffer << 8) | data[i];
      bits += 8;
      while (bits >= 5) {
        bits -= 5;
        ret.push_back(ALPHABET[(buffer >> bits) & 0x1f]);
      }
    }
    // Final partial group is zero-filled on the right
    if (bits > 0) ret.push_back(ALPHABET[(buffer << (5 - bits)) & 0x1f]);
    return ret;
  }

  auto decode(string_view input, string& out) -> size_t {
    const auto in_len = input.length();
    // A trailing group of 1, 3 or 6 characters cannot come from whole bytes
    switch (in_len % 8) {
      case 1: case 3: case 6:
        throw DecodeError(
          DecodeError::Kind::Malformed,
          fmt::format("illegal base32 data: length {} is not a valid encoding length", in_len),
          in_len
        );
    }
    out.clear();
    out.reserve(in_len * 5 / 8);
    uint32_t buffer = 0;
    uint8_t bits = 0;
    for (size_t i = 0; i < in_len; i++) {
      const auto v = DECODING_TABLE[static_cast<uint8_t>(input[i])];
      if (v == INVALID) {
        throw DecodeError(
          DecodeError::Kind::Malformed,
          fmt::format("illegal base32 data at input byte {}", i),
          in_len
        );
      }
      buffer = (buffer << 5) | v;
      bits += 5;
      if (bits >= 8) {
        bits -= 8;
        out.push_back(static_cast<char>((buffer >> bits) & 0xff));
      }
    }
    return out.length();
  }

  auto decode(string_view input) -> string {
    string out;
    decode(input, out);
    return out;
  }
}
