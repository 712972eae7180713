#pragma once
#include "util/common.h++"

namespace Hex {

// Lowercase, two characters per byte
auto encode(const uint8_t* data, size_t len) -> std::string;

static inline auto encode(std::string_view data) -> std::string {
  return encode(reinterpret_cast<const uint8_t*>(data.data()), data.length());
}

// Accepts either case; throws Crystal::DecodeError (Malformed) on any other
// character or an odd input length
auto decode(std::string_view input, std::string& out) -> size_t;

auto decode(std::string_view input) -> std::string;

}
