#pragma once
#include "util/common.h++"

// Unpadded base32 with a lowercase Crockford-style alphabet (no i, l, o, u)
namespace Base32 {

static constexpr std::string_view ALPHABET = "0123456789abcdefghjkmnpqrstvwxyz";

constexpr auto encoded_length(size_t in_len) noexcept -> size_t {
  return (in_len * 8 + 4) / 5;
}

auto encode(const uint8_t* data, size_t len) -> std::string;

static inline auto encode(std::string_view data) -> std::string {
  return encode(reinterpret_cast<const uint8_t*>(data.data()), data.length());
}

// Throws Crystal::DecodeError (Malformed) on characters outside ALPHABET or
// an impossible input length. Leftover bits past the last byte are ignored.
auto decode(std::string_view input, std::string& out) -> size_t;

auto decode(std::string_view input) -> std::string;

}
