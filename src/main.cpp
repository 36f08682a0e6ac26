#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <coffer/client/instructions.hpp>
#include <coffer/crypto/keypair.hpp>
#include <coffer/ledger/ledger.hpp>
#include <coffer/program/processor.hpp>
#include <coffer/schema/vault_state.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;
using coffer::schema::to_hex;

struct cli_options final {
  std::string command;
  std::string ledger_path;
  std::string keypair_path;
  std::optional<std::string> program_id;
  coffer::schema::lamports_t lamports{};
  coffer::schema::lamports_t amount{};
  std::optional<uint32_t> bump;
};

std::optional<coffer::crypto::keypair_t> read_keypair(const std::string& path) {
  auto input = std::ifstream{path};
  if (!input) {
    spdlog::error("Cannot open keypair file '{}'", path);
    return std::nullopt;
  }
  auto hex = std::string{};
  input >> hex;
  auto seed = coffer::schema::try_make_hash32(hex);
  if (!seed) {
    spdlog::error("Keypair file '{}' does not hold a 32-byte hex seed", path);
    return std::nullopt;
  }
  return coffer::crypto::keypair_from_seed(*seed);
}

int keygen(const cli_options& options) {
  const auto keypair = coffer::crypto::generate_keypair();
  auto output = std::ofstream{options.keypair_path, std::ios::trunc};
  if (!output) {
    spdlog::error("Cannot write keypair file '{}'", options.keypair_path);
    return 1;
  }
  output << to_hex(keypair.seed) << '\n';
  std::cout << to_hex(keypair.public_key) << std::endl;
  return 0;
}

int submit(coffer::ledger::ledger& ledger,
           const coffer::crypto::keypair_t& keypair,
           coffer::ledger::instruction_call_t instruction) {
  auto instructions = std::vector<coffer::ledger::instruction_call_t>{};
  instructions.push_back(std::move(instruction));
  auto transaction = coffer::client::make_transaction(
      std::move(instructions), ledger.latest_blockhash(), {keypair});
  auto result = ledger.send_transaction(transaction);
  if (!coffer::schema::succeeded(result)) {
    std::cerr << result.codespace << " error " << result.code << " ("
              << coffer::schema::to_string(
                     static_cast<coffer::schema::program_error_code>(
                         result.code))
              << "): " << result.log << std::endl;
    return 1;
  }
  std::cout << "ok, slot " << ledger.slot() << std::endl;
  return 0;
}

int show(const coffer::ledger::ledger& ledger,
         const coffer::schema::address_t& vault) {
  auto account = ledger.get_account(vault);
  if (!account) {
    std::cout << "vault " << to_hex(vault) << " does not exist" << std::endl;
    return 1;
  }
  auto record = coffer::schema::read_vault_record(
      coffer::schema::make_bytes_view(account->data));
  if (!record) {
    std::cout << "account " << to_hex(vault) << " is not a vault"
              << std::endl;
    return 1;
  }
  std::cout << "vault     " << to_hex(vault) << '\n'
            << "authority " << to_hex(record->authority) << '\n'
            << "balance   " << record->balance << '\n'
            << "lamports  " << account->lamports << std::endl;
  return 0;
}

int run(const cli_options& options) {
  if (options.command == "keygen") {
    return keygen(options);
  }

  auto keypair = read_keypair(options.keypair_path);
  if (!keypair) {
    return 1;
  }
  auto program_id = coffer::client::make_program_id();
  if (options.program_id) {
    auto parsed = coffer::schema::try_make_hash32(*options.program_id);
    if (!parsed) {
      spdlog::error("--program-id must be 32 bytes of hex");
      return 1;
    }
    program_id = *parsed;
  }
  if (options.bump && *options.bump > 255) {
    spdlog::error("--bump must be in 0..255");
    return 1;
  }

  const auto& authority = keypair->public_key;
  const auto [vault, found_bump] =
      coffer::client::vault_address(authority, program_id);
  const auto bump =
      options.bump ? static_cast<uint8_t>(*options.bump) : found_bump;

  if (options.command == "address") {
    std::cout << "authority " << to_hex(authority) << '\n'
              << "program   " << to_hex(program_id) << '\n'
              << "vault     " << to_hex(vault) << '\n'
              << "bump      " << static_cast<uint32_t>(found_bump)
              << std::endl;
    return 0;
  }

  auto encoder = coffer::schema::encoding::encoder<
      coffer::schema::encoding::scale_encoder_tag>{};
  auto storage =
      coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(
          options.ledger_path);
  auto ledger = coffer::ledger::ledger{encoder, storage};
  ledger.add_program(program_id, coffer::program::process);

  if (options.command == "airdrop") {
    auto result = ledger.airdrop(authority, options.lamports);
    if (!coffer::schema::succeeded(result)) {
      std::cerr << result.log << std::endl;
      return 1;
    }
    std::cout << "balance " << ledger.get_account(authority)->lamports
              << std::endl;
    return 0;
  }
  if (options.command == "create") {
    return submit(ledger, *keypair,
                  coffer::client::make_create_vault_instruction(
                      program_id, authority, vault, bump));
  }
  if (options.command == "credit") {
    return submit(ledger, *keypair,
                  coffer::client::make_credit_vault_instruction(
                      program_id, authority, vault, options.amount));
  }
  if (options.command == "debit") {
    return submit(ledger, *keypair,
                  coffer::client::make_debit_vault_instruction(
                      program_id, authority, vault, options.amount, bump));
  }
  if (options.command == "show") {
    return show(ledger, vault);
  }

  spdlog::error("Unknown command '{}'", options.command);
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("coffer.log", false);
  console_sink->set_level(spdlog::level::warn);

  auto logger = std::make_shared<spdlog::async_logger>(
      "coffer", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto options = cli_options{};
  auto vm = po::variables_map{};
  auto description = po::options_description{
      "Usage: coffer <keygen|address|airdrop|create|credit|debit|show> "
      "[options]"};
  description.add_options()("help,h", "Show the help message")(
      "ledger-path,l",
      po::value<std::string>(&options.ledger_path)
          ->default_value("coffer-ledger"),
      "RocksDB directory of the ledger")(
      "keypair,k",
      po::value<std::string>(&options.keypair_path)
          ->default_value("coffer-keypair.hex"),
      "File holding the authority's hex seed")(
      "program-id", po::value<std::string>(),
      "Hex program id; defaults to blake3(\"coffer.vault\")")(
      "lamports", po::value<coffer::schema::lamports_t>(&options.lamports),
      "Lamports to airdrop")(
      "amount", po::value<coffer::schema::lamports_t>(&options.amount),
      "Lamports to credit or debit")(
      "bump", po::value<uint32_t>(),
      "Bump seed; defaults to the one found for the vault")(
      "verbose,v", "Enable verbose output");
  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&options.command));
  auto all = po::options_description{};
  all.add(description).add(hidden);
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n' << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help") || options.command.empty()) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return vm.contains("help") ? 0 : 1;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
    console_sink->set_level(spdlog::level::debug);
  }
  if (vm.contains("program-id")) {
    options.program_id = vm["program-id"].as<std::string>();
  }
  if (vm.contains("bump")) {
    options.bump = vm["bump"].as<uint32_t>();
  }

  auto status = run(options);
  spdlog::shutdown();
  return status;
}
