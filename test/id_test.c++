#include "test_common.h++"
#include "models/id.h++"
#include "util/hex.h++"
#include <fmt/format.h>

static constexpr int64_t MAX_ID = std::numeric_limits<int64_t>::max();

TEST_CASE("layout clamps time bits", "[id]") {
  REQUIRE(IdLayout().time_bits() == DEFAULT_TIME_BITS);
  REQUIRE(IdLayout().sequence_bits() == 21);
  REQUIRE(IdLayout(DEFAULT_EPOCH_MS, 0).time_bits() == MIN_TIME_BITS);
  REQUIRE(IdLayout(DEFAULT_EPOCH_MS, 39).time_bits() == MIN_TIME_BITS);
  REQUIRE(IdLayout(DEFAULT_EPOCH_MS, 40).time_bits() == 40);
  REQUIRE(IdLayout(DEFAULT_EPOCH_MS, 48).time_bits() == 48);
  REQUIRE(IdLayout(DEFAULT_EPOCH_MS, 49).time_bits() == MAX_TIME_BITS);
  REQUIRE(IdLayout(DEFAULT_EPOCH_MS, 100).time_bits() == MAX_TIME_BITS);
  REQUIRE(IdLayout(DEFAULT_EPOCH_MS, -5).sequence_bits() == 23);
  REQUIRE(IdLayout(DEFAULT_EPOCH_MS, 100).sequence_bits() == 15);
}

TEST_CASE("layout masks", "[id]") {
  const IdLayout layout(DEFAULT_EPOCH_MS, 40);
  REQUIRE(layout.sequence_mask() == (uint64_t{1} << 23) - 1);
  REQUIRE(layout.seed_mask() == (uint64_t{1} << 22) - 1);
  REQUIRE(layout.offset_mask() == (uint64_t{1} << 40) - 1);
}

TEST_CASE("seed mask covers the lower half of the sequence range", "[id]") {
  REQUIRE(seed_mask_for(0) == 0);
  REQUIRE(seed_mask_for(1) == 0);
  REQUIRE(seed_mask_for(2) == 1);
  REQUIRE(seed_mask_for(21) == (uint64_t{1} << 20) - 1);
  for (int bits = MIN_TIME_BITS; bits <= MAX_TIME_BITS; bits++) {
    const IdLayout layout(DEFAULT_EPOCH_MS, bits);
    REQUIRE(layout.seed_mask() == layout.sequence_mask() >> 1);
  }
}

TEST_CASE("layout packs and unpacks", "[id]") {
  const IdLayout layout;
  const auto id = layout.pack(123456789, 4242);
  REQUIRE(id == (int64_t{123456789} << 21 | 4242));
  REQUIRE(layout.offset_of_id(id) == 123456789);
  REQUIRE(layout.sequence_of_id(id) == 4242);
  REQUIRE(layout.timestamp_ms_of_id(id) == DEFAULT_EPOCH_MS + 123456789);
  REQUIRE(layout.pack(layout.offset_mask(), layout.sequence_mask()) == MAX_ID);
}

TEST_CASE("layout offsets never go below the epoch", "[id]") {
  const IdLayout layout;
  REQUIRE(layout.offset_of(DEFAULT_EPOCH_MS + 5) == 5);
  REQUIRE(layout.offset_of(DEFAULT_EPOCH_MS) == 0);
  REQUIRE(layout.offset_of(DEFAULT_EPOCH_MS - 5) == 0);
  REQUIRE(layout.offset_of(0) == 0);
}

TEST_CASE("IDs encode to fixed widths", "[id]") {
  for (auto n : { int64_t{0}, int64_t{1}, int64_t{0x0123456789abcdef}, MAX_ID }) {
    const auto id = Id::from_int64(n);
    REQUIRE(id.base32().length() == ID_BASE32_LENGTH);
    REQUIRE(id.hex().length() == ID_HEX_LENGTH);
  }
  REQUIRE(Id(0).base32() == "0000000000000");
  REQUIRE(Id(0).hex() == "0000000000000000");
  REQUIRE(Id(1).base32() == "0000000000002");
  REQUIRE(Id(MAX_ID).base32() == "fzzzzzzzzzzzy");
  REQUIRE(Id(MAX_ID).hex() == "7fffffffffffffff");
  REQUIRE(Id(0x0123456789abcdef).base32() == "04hmasw9nf6yy");
  REQUIRE(Id(0x0123456789abcdef).hex() == "0123456789abcdef");
}

TEST_CASE("IDs survive every encoding", "[id]") {
  for (auto n : { int64_t{0}, int64_t{1}, int64_t{0x0123456789abcdef}, MAX_ID }) {
    const auto id = Id::from_int64(n);
    REQUIRE(Id::from_base32(id.base32()) == id);
    REQUIRE(Id::from_string(id.to_string()) == id);
    REQUIRE(Id::from_hex(id.hex()) == id);
    REQUIRE(Id::from_int64(id.to_int64()) == id);
  }
  REQUIRE(Id::from_hex("0123456789ABCDEF") == Id(0x0123456789abcdef));
}

TEST_CASE("decoding rejects malformed IDs", "[id]") {
  try {
    Id::from_base32("invalid!@#");
    FAIL("decoded invalid!@# as base32");
  } catch (const DecodeError& e) {
    REQUIRE(e.kind == DecodeError::Kind::Malformed);
  }
  try {
    Id::from_hex("invalid!@#");
    FAIL("decoded invalid!@# as hex");
  } catch (const DecodeError& e) {
    REQUIRE(e.kind == DecodeError::Kind::Malformed);
  }
  REQUIRE_THROWS_AS(Id::from_string("invalid!@#"), DecodeError);
  REQUIRE_THROWS_AS(Id::from_hex("zzzz"), DecodeError);
}

TEST_CASE("decoding rejects IDs of the wrong length", "[id]") {
  for (auto bad : { "abcd"sv, "00000000000000"sv, "000000000000000000"sv, ""sv }) {
    try {
      Id::from_hex(bad);
      FAIL("decoded " << bad << " as hex");
    } catch (const DecodeError& e) {
      REQUIRE(e.kind == DecodeError::Kind::WrongLength);
    }
  }
  for (auto bad : { "000000000000"sv, "0000000000000000"sv, "00"sv, ""sv }) {
    try {
      Id::from_base32(bad);
      FAIL("decoded " << bad << " as base32");
    } catch (const DecodeError& e) {
      REQUIRE(e.kind == DecodeError::Kind::WrongLength);
    }
  }
}

TEST_CASE("IDs report the time they were packed with", "[id]") {
  const IdLayout layout(DEFAULT_EPOCH_MS, 44);
  const int64_t when = 1'700'000'000'123;
  const auto id = Id(layout.pack(layout.offset_of(when), 77));
  REQUIRE(timestamp_to_ms(id.time(layout)) == when);
  REQUIRE(id.sequence(layout) == 77);
  // A different layout silently gives a different answer
  REQUIRE(timestamp_to_ms(id.time(IdLayout(DEFAULT_EPOCH_MS, 42))) != when);
}

TEST_CASE("the largest ID reports its time at every layout", "[id]") {
  const IdLayout widest(DEFAULT_EPOCH_MS, 48);
  REQUIRE(timestamp_to_ms(Id(MAX_ID).time(widest)) == (MAX_ID >> 15) + DEFAULT_EPOCH_MS);
  REQUIRE(timestamp_to_ms(Id(MAX_ID).time(widest)) == 283'052'813'510'655);
  const IdLayout narrowest(DEFAULT_EPOCH_MS, 40);
  REQUIRE(timestamp_to_ms(Id(MAX_ID).time(narrowest)) == (MAX_ID >> 23) + DEFAULT_EPOCH_MS);
  REQUIRE(Id(MAX_ID).time(widest) > Id(0).time(widest));
}

TEST_CASE("IDs order, hash, and format by value", "[id]") {
  REQUIRE(Id(1) < Id(2));
  REQUIRE(Id(2) > Id(1));
  REQUIRE(Id(5) == Id::from_int64(5));
  std::unordered_set<Id> ids { Id(1), Id(2), Id(1) };
  REQUIRE(ids.size() == 2);
  REQUIRE(fmt::format("{}", Id(MAX_ID)) == "fzzzzzzzzzzzy");
  REQUIRE(Id().to_int64() == 0);
}

TEST_CASE("base32 IDs decode even with leftover bits set", "[id]") {
  // The 13th character carries one spare bit
  REQUIRE(Id::from_base32("0000000000001") == Id(0));
  REQUIRE(Id::from_base32("0000000000000") == Id(0));
  REQUIRE(Id::from_base32("fzzzzzzzzzzzz") == Id(MAX_ID));
}

TEST_CASE("hex form matches the byte encoding", "[id]") {
  for (int64_t n : { int64_t{0}, int64_t{1}, int64_t{0xabcdef}, MAX_ID }) {
    const auto bytes = Id(n).to_bytes();
    REQUIRE(Id(n).hex() == Hex::encode(bytes.data(), bytes.size()));
  }
}

TEST_CASE("any form of an ID parses, digits first", "[id]") {
  REQUIRE(Id::from_any("0") == Id(0));
  REQUIRE(Id::from_any("42") == Id(42));
  // Decimal strings as long as a base32 or hex ID stay decimal
  REQUIRE(Id::from_any("1234567890123") == Id(1234567890123));
  REQUIRE(Id::from_any("1234567890123456") == Id(1234567890123456));
  REQUIRE(Id::from_any("9223372036854775807") == Id(MAX_ID));
  REQUIRE(Id::from_any(Id(MAX_ID).hex()) == Id(MAX_ID));
  REQUIRE(Id::from_any(Id(MAX_ID).base32()) == Id(MAX_ID));
  REQUIRE(Id::from_any("00000000000000ff") == Id(0xff));
  REQUIRE(Id::from_any("0000000000001") == Id(1));
  REQUIRE_THROWS_AS(Id::from_any("9223372036854775808"), DecodeError);
  REQUIRE_THROWS_AS(Id::from_any(""), DecodeError);
  REQUIRE_THROWS_AS(Id::from_any("-1"), DecodeError);
}
