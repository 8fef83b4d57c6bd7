#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <popchain/catalog/tier_catalog.hpp>
#include <popchain/common/critical.hpp>
#include <popchain/execution/engine.hpp>
#include <popchain/schema/encoding/scale/encoder.hpp>
#include <popchain/schema/transaction.hpp>
#include <popchain/schema/transaction_error_code.hpp>
#include <popchain/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

using encoder_t = popchain::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

popchain::schema::hash32_t get_hash32(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    popchain::common::critical("missing required option --" + name);
  }
  auto value = popchain::schema::try_make_address(vm[name].as<std::string>());
  if (!value.has_value()) {
    popchain::common::critical("--" + name + " must be a hex id of at most 32 bytes");
  }
  return *value;
}

std::optional<popchain::schema::address_t> get_optional_address(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return get_hash32(vm, name);
}

popchain::schema::timestamp_milliseconds_t now_ms() {
  return static_cast<popchain::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

popchain::schema::mint_certificate_t build_mint(const po::variables_map& vm) {
  auto operation = popchain::schema::mint_certificate_t{
      .account_id = get_hash32(vm, "account"),
      .event_id = get_hash32(vm, "event"),
      .url = popchain::schema::make_bytes(vm["url"].as<std::string>()),
      .service_wallet = get_hash32(vm, "service-wallet")};

  if (vm.contains("tier-name")) {
    operation.tier_name =
        popchain::schema::make_bytes(vm["tier-name"].as<std::string>());
    operation.tier_description =
        popchain::schema::make_bytes(vm["tier-description"].as<std::string>());
    operation.tier_url =
        popchain::schema::make_bytes(vm["tier-url"].as<std::string>());
    operation.price = vm["price"].as<uint64_t>();
    return operation;
  }

  auto index = vm["tier"].as<std::size_t>();
  auto tiers = popchain::catalog::default_popchain_tiers();
  if (index >= tiers.size()) {
    popchain::common::critical("--tier must be 0..3 (PopPass..PopTrophy)");
  }
  const auto& tier = tiers[index];
  operation.tier_name = popchain::schema::make_bytes(tier.name);
  operation.tier_description = popchain::schema::make_bytes(tier.description);
  operation.tier_url = popchain::schema::make_bytes(tier.url.value);
  operation.price = tier.price;
  return operation;
}

popchain::schema::transaction_payload_t build_payload(
    const std::string& command,
    const po::variables_map& vm) {
  if (command == "upsert-account") {
    return popchain::schema::upsert_account_t{
        .account_id = get_hash32(vm, "account"),
        .owner = get_optional_address(vm, "owner")};
  }
  if (command == "mint") {
    return build_mint(vm);
  }
  if (command == "transfer") {
    return popchain::schema::transfer_certificate_to_wallet_t{
        .account_id = get_hash32(vm, "account"),
        .certificate_id = get_hash32(vm, "certificate")};
  }
  popchain::common::critical("unsupported transaction command");
}

// Transfers are checked against the current custodian and links against
// the wallet being linked, so both need an explicit sender.
popchain::schema::address_t get_sender(const std::string& command,
                                       const po::variables_map& vm) {
  if (command == "transfer" ||
      (command == "upsert-account" && vm.contains("owner"))) {
    return get_hash32(vm, "sender");
  }
  if (!vm.contains("sender")) {
    return popchain::schema::make_zero_hash();
  }
  return get_hash32(vm, "sender");
}

std::string format_owner(
    const std::optional<popchain::schema::address_t>& owner) {
  return owner.has_value() ? popchain::schema::to_hex(*owner) : "unlinked";
}

void print_certificate(const popchain::schema::certificate_t& certificate) {
  std::cout << "certificate " << popchain::schema::to_hex(certificate.id)
            << '\n'
            << "  event_id:   " << popchain::schema::to_hex(certificate.event_id)
            << '\n'
            << "  tier_name:  " << certificate.tier_name << '\n'
            << "  url:        " << certificate.url.value << '\n'
            << "  tier_url:   " << certificate.tier_url.value << '\n'
            << "  issued_to:  " << format_owner(certificate.issued_to) << '\n'
            << "  issued_at:  " << certificate.issued_at << '\n'
            << "  mint_price: " << certificate.mint_price << '\n';
}

void print_result(const popchain::schema::transaction_result_t& result) {
  std::cout << "code: " << result.code << " [" << result.codespace << "] "
            << result.info << '\n';
  if (!result.log.empty()) {
    std::cout << "log: " << result.log << '\n';
  }
  if (result.data.size() == 32) {
    std::cout << "id: "
              << popchain::schema::to_hex(
                     popchain::schema::make_hash32(result.data))
              << '\n';
  }
  for (const auto& event : result.events) {
    std::cout << "event " << event.type << '\n';
    for (const auto& attribute : event.attributes) {
      std::cout << "  " << attribute.key << ": " << attribute.value << '\n';
    }
  }
}

void configure_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "popchain", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  popchain tiers\n"
            << "  popchain upsert-account --account ID "
               "[--owner ADDR --sender ADDR]\n"
            << "  popchain mint --account ID --event ID --url URL "
               "(--tier N | --tier-name ... --price P)\n"
            << "  popchain transfer --sender ADDR --account ID "
               "--certificate ID\n"
            << "  popchain account|certificate|holdings|events|info "
               "[options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto log_file = std::string{};

  auto options = po::options_description{"popchain options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "tiers|upsert-account|mint|transfer|account|certificate|holdings|"
      "events|info")("config,c", po::value<std::string>(&config_path),
                     "INI file with default option values")(
      "verbose,v", "enable debug logging")(
      "log-file", po::value<std::string>(&log_file)->default_value(
                      "popchain.log"),
      "log file path");

  auto ledger = po::options_description{"ledger"};
  ledger.add_options()(
      "db", po::value<std::string>(&db_path)->default_value("popchain-data"),
      "RocksDB directory")("service-wallet", po::value<std::string>(),
                           "escrow wallet for unlinked accounts")(
      "sender", po::value<std::string>(), "transaction sender address")(
      "account", po::value<std::string>(), "account id hex")(
      "owner", po::value<std::string>(), "wallet address to link")(
      "event", po::value<std::string>(), "event id hex")(
      "url", po::value<std::string>()->default_value(""),
      "certificate metadata url")("tier",
                                  po::value<std::size_t>()->default_value(0),
                                  "default tier index")(
      "tier-name", po::value<std::string>(), "custom tier name")(
      "tier-description", po::value<std::string>()->default_value(""),
      "custom tier description")("tier-url",
                                 po::value<std::string>()->default_value(""),
                                 "custom tier artwork url")(
      "price", po::value<uint64_t>()->default_value(0),
      "custom tier price in minor units")(
      "certificate", po::value<std::string>(), "certificate id hex")(
      "holder", po::value<std::string>(), "custodian address")(
      "from", po::value<uint64_t>()->default_value(1), "first event id")(
      "to", po::value<uint64_t>()->default_value(UINT64_MAX),
      "last event id");
  options.add(ledger);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto config = std::ifstream{vm["config"].as<std::string>()};
    if (!config) {
      std::cerr << "cannot open config file " << vm["config"].as<std::string>()
                << '\n';
      return 1;
    }
    po::store(po::parse_config_file(config, ledger), vm);
  }
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  configure_logging(log_file, vm.contains("verbose"));

  if (command == "tiers") {
    auto index = 0;
    for (const auto& tier : popchain::catalog::default_popchain_tiers()) {
      std::cout << index++ << ' ' << popchain::catalog::get_tier_name(tier)
                << ' ' << popchain::catalog::get_tier_price(tier) << ' '
                << tier.url.value << '\n';
    }
    spdlog::shutdown();
    return 0;
  }

  auto encoder = encoder_t{};
  auto storage =
      popchain::storage::make_storage<popchain::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = popchain::execution::engine{encoder, storage};

  auto exit_code = 0;
  if (command == "upsert-account" || command == "mint" ||
      command == "transfer") {
    auto transaction = popchain::schema::transaction_t{
        .sender = get_sender(command, vm),
        .payload = build_payload(command, vm)};
    auto encoded = encoder.encode(transaction);
    auto result = engine.execute(
        popchain::schema::bytes_view_t{encoded.data(), encoded.size()},
        now_ms());
    print_result(result);
    exit_code = result.code == 0 ? 0 : 2;
  } else if (command == "account") {
    auto account = engine.account(get_hash32(vm, "account"));
    if (!account) {
      std::cout << "account not found\n";
      exit_code = 2;
    } else {
      std::cout << "account " << popchain::schema::to_hex(account->account_id)
                << "\n  owner: " << format_owner(account->owner) << '\n';
      for (const auto& id : account->certificate_ids) {
        std::cout << "  certificate " << popchain::schema::to_hex(id) << '\n';
      }
    }
  } else if (command == "certificate") {
    auto certificate_id = get_hash32(vm, "certificate");
    auto certificate = engine.certificate(certificate_id);
    if (!certificate) {
      std::cout << "certificate not found\n";
      exit_code = 2;
    } else {
      print_certificate(*certificate);
      if (auto custody = engine.custody(certificate_id)) {
        std::cout << "  custodian:  " << popchain::schema::to_hex(custody->holder)
                  << '\n';
      }
    }
  } else if (command == "holdings") {
    for (const auto& record : engine.holdings(get_hash32(vm, "holder"))) {
      std::cout << popchain::schema::to_hex(record.object_id) << " since "
                << record.since << '\n';
    }
  } else if (command == "events") {
    for (const auto& record :
         engine.events(vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>())) {
      std::cout << record.event_id << " seq " << record.sequence << ' '
                << record.event.type << '\n';
      for (const auto& attribute : record.event.attributes) {
        std::cout << "  " << attribute.key << ": " << attribute.value << '\n';
      }
    }
  } else if (command == "info") {
    auto info = engine.info();
    std::cout << info.data << ' ' << info.version << "\nsequence "
              << info.last_sequence << "\nstate_root "
              << popchain::schema::to_hex(info.last_state_root) << '\n';
  } else {
    spdlog::error("Unknown command '{}'", command);
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
