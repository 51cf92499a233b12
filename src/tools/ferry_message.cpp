#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/program_options.hpp>
#include <ferry/codec/message.hpp>
#include <ferry/common/critical.hpp>
#include <ferry/custody/token_ledger.hpp>
#include <ferry/storage/rocksdb/storage.hpp>

#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

namespace {

namespace po = boost::program_options;

void configure_logging(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::async_logger>(
      "ferry_message", spdlog::sinks_init_list{console_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    ferry::common::critical("missing required option --{}", name);
  }
  return vm[name].as<std::string>();
}

// Parsed unbounded first; a direct uint256 parse wraps out-of-range input.
ferry::schema::token_id_t parse_token_id(const std::string& value) {
  if (value.empty() || value.front() == '-') {
    ferry::common::critical("token id '{}' must be a non-negative integer",
                            value);
  }
  auto parsed = boost::multiprecision::cpp_int{};
  try {
    parsed = boost::multiprecision::cpp_int{value};
  } catch (const std::exception& ex) {
    ferry::common::critical(
        "token id '{}' is not a decimal or 0x-hex integer: {}", value,
        ex.what());
  }
  const auto max = boost::multiprecision::cpp_int{
      std::numeric_limits<ferry::schema::token_id_t>::max()};
  if (parsed < 0 || parsed > max) {
    ferry::common::critical("token id '{}' does not fit in 256 bits", value);
  }
  return static_cast<ferry::schema::token_id_t>(parsed);
}

std::string hex_of(const ferry::schema::hash32_t& value) {
  return "0x" + ferry::schema::to_hex(
                    ferry::schema::bytes_view_t{value.data(), value.size()});
}

int run_format(const po::variables_map& vm) {
  auto recipient = ferry::schema::try_make_hash32(require(vm, "recipient"));
  if (!recipient) {
    ferry::common::critical("recipient must be at most 32 bytes of hex");
  }
  auto payload =
      ferry::codec::format(*recipient, parse_token_id(require(vm, "token-id")),
                           vm["token-uri"].as<std::string>());
  std::cout << "0x"
            << ferry::schema::to_hex(
                   ferry::schema::bytes_view_t{payload.data(), payload.size()})
            << '\n';
  return 0;
}

int run_decode(const po::variables_map& vm) {
  auto payload = ferry::schema::try_from_hex(require(vm, "payload"));
  if (!payload) {
    ferry::common::critical("payload must be hex");
  }
  auto message = ferry::codec::try_decode(
      ferry::schema::bytes_view_t{payload->data(), payload->size()});
  if (!message) {
    spdlog::error("payload of {} bytes is shorter than {}", payload->size(),
                  ferry::codec::kPrefixSize);
    return 1;
  }
  std::cout << "recipient: " << hex_of(message->recipient) << '\n'
            << "token_id: " << message->token_id.str() << '\n'
            << "token_uri: " << message->token_uri << '\n';
  return 0;
}

int run_owner_of(const po::variables_map& vm) {
  auto path = require(vm, "db");
  if (!std::filesystem::is_directory(path)) {
    ferry::common::critical("no ledger at {}", path);
  }
  auto storage =
      ferry::storage::make_storage<ferry::storage::rocksdb_storage_tag>(path);
  auto state = ferry::custody::state_t{storage};
  auto owner = ferry::custody::token_ledger::owner_of(
      state, parse_token_id(require(vm, "token-id")));
  if (!owner) {
    std::cout << "none\n";
    return 1;
  }
  std::cout << "0x"
            << ferry::schema::to_hex(
                   ferry::schema::bytes_view_t{owner->data(), owner->size()})
            << '\n';
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  ferry_message format --recipient HEX --token-id N "
               "[--token-uri URI]\n"
            << "  ferry_message decode --payload HEX\n"
            << "  ferry_message owner-of --db PATH --token-id N\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"ferry_message options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "format|decode|owner-of")(
      "recipient", po::value<std::string>(), "recipient identity, hex")(
      "token-id", po::value<std::string>(), "token id, decimal or 0x-hex")(
      "token-uri", po::value<std::string>()->default_value(""),
      "token metadata uri")("payload", po::value<std::string>(),
                            "encoded transfer message, hex")(
      "db", po::value<std::string>(), "ledger RocksDB path")(
      "verbose,v", "enable debug logging");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  configure_logging(vm.contains("verbose"));

  auto exit_code = 0;
  if (vm.contains("help") || command.empty()) {
    print_help(options);
  } else if (command == "format") {
    exit_code = run_format(vm);
  } else if (command == "decode") {
    exit_code = run_decode(vm);
  } else if (command == "owner-of") {
    exit_code = run_owner_of(vm);
  } else {
    ferry::common::critical(
        "unknown command '{}', expected format|decode|owner-of", command);
  }

  spdlog::shutdown();
  return exit_code;
}
