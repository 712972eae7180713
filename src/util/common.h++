#pragma once
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <array>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <byteswap.h>

namespace Crystal {

constexpr std::string_view VERSION = "0.1.0";

#if __BIG_ENDIAN__
#  define to_big_endian(x) x
#else
#  define to_big_endian(x) bswap_64(x)
#endif

// Millisecond precision holds every offset a 63-bit ID can carry
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

// Source of wall-clock milliseconds since the Unix epoch
using MillisClock = std::function<int64_t ()>;

static inline auto timestamp_to_ms(Timestamp ts) noexcept -> int64_t {
  return ts.time_since_epoch().count();
}
static inline auto ms_to_timestamp(int64_t ms) noexcept -> Timestamp {
  return Timestamp(std::chrono::milliseconds(ms));
}
static inline auto now_t() -> Timestamp {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}
static inline auto now_ms() -> int64_t {
  return timestamp_to_ms(now_t());
}
static inline auto now_ns() -> uint64_t {
  return static_cast<uint64_t>(
    std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::high_resolution_clock::now().time_since_epoch()
    ).count()
  );
}

static inline auto read_uint64_be(const uint8_t bytes[8]) noexcept -> uint64_t {
  uint64_t n;
  memcpy(&n, bytes, sizeof(uint64_t));
  return to_big_endian(n);
}

static inline auto write_uint64_be(uint64_t n, uint8_t bytes[8]) noexcept -> void {
  n = to_big_endian(n);
  memcpy(bytes, &n, sizeof(uint64_t));
}

struct DecodeError : public std::runtime_error {
  enum class Kind : uint8_t {
    Malformed,
    WrongLength
  };
  Kind kind;
  size_t input_length;
  DecodeError(Kind kind, std::string message, size_t input_length)
    : std::runtime_error(std::move(message)), kind(kind), input_length(input_length) {}
};

using Sha256 = std::array<uint8_t, 32>;

// Throws if OpenSSL cannot produce a digest; callers that must not fail catch this
static inline auto sha256(std::initializer_list<std::string_view> parts) -> Sha256 {
  Sha256 out;
  std::unique_ptr<EVP_MD_CTX, void(*)(EVP_MD_CTX*)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || !EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw std::runtime_error("SHA-256 digest init failed");
  }
  for (auto part : parts) {
    if (!EVP_DigestUpdate(ctx.get(), part.data(), part.length())) {
      throw std::runtime_error("SHA-256 digest update failed");
    }
  }
  unsigned len;
  if (!EVP_DigestFinal_ex(ctx.get(), out.data(), &len) || len != out.size()) {
    throw std::runtime_error("SHA-256 digest final failed");
  }
  return out;
}

static inline auto as_string_view(const uint8_t* data, size_t len) noexcept -> std::string_view {
  return std::string_view(reinterpret_cast<const char*>(data), len);
}

// Common base class for custom formatters
struct CustomFormatter {
  constexpr auto parse(fmt::format_parse_context& ctx) -> fmt::format_parse_context::iterator {
    return ctx.begin();
  }
};

}
