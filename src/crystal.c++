#include "util/common.h++"
#include "models/id.h++"
#include "services/generator.h++"
#include <fmt/chrono.h>
#include <optparse.h>

using namespace Crystal;
using std::optional, std::runtime_error, std::stoi, std::stoll, std::string;

static auto format_time(Timestamp t) -> string {
  const auto secs = std::chrono::floor<std::chrono::seconds>(t);
  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}Z",
    fmt::gmtime(static_cast<time_t>(secs.time_since_epoch().count())),
    (t - secs).count()
  );
}

static auto print_id(const Id& id, const IdLayout& layout) -> void {
  fmt::print("  Int64:    {}\n", id.to_int64());
  fmt::print("  Base32:   {}\n", id.base32());
  fmt::print("  Hex:      {}\n", id.hex());
  fmt::print("  Time:     {}\n", format_time(id.time(layout)));
  fmt::print("  Sequence: {}\n", id.sequence(layout));
}

int main(int argc, char** argv) {
  auto parser = optparse::OptionParser()
    .version(string(VERSION))
    .description("Generates and decodes coordination-free, time-sortable 63-bit IDs");
  parser.add_option("-n", "--count")
    .dest("count")
    .type("INT")
    .help("number of IDs to generate (default = 10)")
    .set_default(10);
  parser.add_option("--epoch")
    .dest("epoch")
    .type("MS")
    .help("epoch, in milliseconds since 1970-01-01T00:00:00Z (default = 2020-01-01T00:00:00Z)")
    .set_default(std::to_string(DEFAULT_EPOCH_MS));
  parser.add_option("--time-bits")
    .dest("time_bits")
    .type("INT")
    .help("width of the timestamp field, clamped to 40-48 (default = 42)")
    .set_default(static_cast<int>(DEFAULT_TIME_BITS));
  parser.add_option("--machine")
    .dest("machine")
    .help("host name to seed the sequence with (default = this host's name)");
  parser.add_option("--pid")
    .dest("pid")
    .type("INT")
    .help("process ID to seed the sequence with (default = this process's ID)");
  parser.add_option("--parse")
    .dest("parse")
    .type("ID")
    .help("decode an ID given as base32, hex, or decimal, then exit");
  parser.add_option("--log-level")
    .dest("log_level")
    .help("log level (trace, debug, info, warn, error, critical)")
    .set_default("info");
  parser.add_help_option();

  const optparse::Values options = parser.parse_args(argc, argv);
  spdlog::set_level(spdlog::level::from_str(options["log_level"]));

  GeneratorConfig config;
  int count;
  try {
    count = stoi(options["count"]);
    config.epoch_ms = stoll(options["epoch"]);
    config.time_bits = stoi(options["time_bits"]);
    if (options.is_set_by_user("pid")) config.pid = stoll(options["pid"]);
  } catch (const std::logic_error& e) {
    spdlog::critical("Invalid numeric option: {}", e.what());
    return EXIT_FAILURE;
  }
  if (count < 0) {
    spdlog::critical("Invalid count: {}", options["count"]);
    return EXIT_FAILURE;
  }
  if (config.time_bits != clamp_time_bits(config.time_bits)) {
    spdlog::warn("--time-bits {} is out of range, using {}", config.time_bits, clamp_time_bits(config.time_bits));
  }
  if (options.is_set_by_user("machine")) config.machine = options["machine"];
  const auto layout = config.layout();

  if (options.is_set_by_user("parse")) {
    try {
      const auto id = Id::from_any(options["parse"]);
      fmt::print("Parsed {}:\n", options["parse"]);
      print_id(id, layout);
      return EXIT_SUCCESS;
    } catch (const DecodeError& e) {
      spdlog::critical("Could not parse {}: {}", options["parse"], e.what());
      return EXIT_FAILURE;
    }
  }

  optional<Generator> maybe_gen;
  try {
    maybe_gen.emplace(std::move(config));
  } catch (const runtime_error& e) {
    spdlog::critical("Could not start ID generator: {}", e.what());
    return EXIT_FAILURE;
  }
  auto& gen = *maybe_gen;

  fmt::print("Generator initialized:\n");
  fmt::print("  Epoch:     {}\n", format_time(gen.epoch()));
  fmt::print("  Time bits: {} ({} sequence bits)\n", gen.layout().time_bits(), gen.layout().sequence_bits());
  fmt::print("  Machine:   {}\n", gen.machine());
  fmt::print("  PID:       {}\n\n", gen.pid());

  fmt::print("Generated IDs:\n");
  fmt::print("{:>4}  {:<19}  {:<13}  {:<16}  {}\n", "#", "Int64", "Base32", "Hex", "Time");
  for (int i = 0; i < count; i++) {
    const auto id = gen.generate();
    fmt::print("{:>4}  {:<19}  {:<13}  {:<16}  {}\n",
      i + 1, id.to_int64(), id.base32(), id.hex(), format_time(id.time(gen.layout()))
    );
  }
  fmt::print("\n");

  const auto id = gen.generate();
  const auto from_base32 = Id::from_base32(id.base32());
  const auto from_hex = Id::from_hex(id.hex());
  const auto from_int64 = Id::from_int64(id.to_int64());
  fmt::print("Round trip of {}:\n", id);
  print_id(id, gen.layout());
  fmt::print("  Base32 match: {}\n", from_base32 == id);
  fmt::print("  Hex match:    {}\n", from_hex == id);
  fmt::print("  Int64 match:  {}\n", from_int64 == id);
  return EXIT_SUCCESS;
}
