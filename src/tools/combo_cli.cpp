#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <combo/common/critical.hpp>
#include <combo/execution/engine.hpp>
#include <combo/fingerprint/fingerprint.hpp>
#include <combo/schema/encoding/scale/encoder.hpp>
#include <combo/schema/transaction.hpp>
#include <combo/storage/rocksdb/storage.hpp>
#include <combo/store/address.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace {

using encoder_t =
    combo::schema::encoding::encoder<combo::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

void configure_logging(const po::variables_map& vm) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (vm.contains("log-file")) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        vm["log-file"].as<std::string>(), false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "combo", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);
}

combo::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    combo::common::critical("missing required hash argument --" + name);
  }
  return combo::schema::make_hash32(vm[name].as<std::string>());
}

uint8_t get_u8(const po::variables_map& vm, const std::string& name) {
  auto value = vm[name].as<uint32_t>();
  if (value > std::numeric_limits<uint8_t>::max()) {
    combo::common::critical("--" + name + " must fit in one byte");
  }
  return static_cast<uint8_t>(value);
}

combo::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (!vm.contains("chain-id")) {
    return combo::execution::default_chain_id();
  }
  return get_hash32(vm, "chain-id");
}

combo::schema::create_combo_t build_create(const po::variables_map& vm) {
  if (!vm.contains("name")) {
    combo::common::critical("missing required argument --name");
  }
  return combo::schema::create_combo_t{
      .name = vm["name"].as<std::string>(),
      .damage = vm["damage"].as<uint32_t>(),
      .meter_gain = vm["meter-gain"].as<uint32_t>(),
      .move_count = get_u8(vm, "move-count"),
      .character_id = get_u8(vm, "character-id")};
}

combo::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    combo::common::critical("transaction mode requires --payload");
  }
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_combo") {
    return build_create(vm);
  }
  if (payload == "verify_combo") {
    auto moves = std::vector<combo::schema::move_id_t>{};
    if (vm.contains("move")) {
      for (const auto move : vm["move"].as<std::vector<uint32_t>>()) {
        if (move > std::numeric_limits<uint8_t>::max()) {
          combo::common::critical("--move must fit in one byte");
        }
        moves.push_back(static_cast<combo::schema::move_id_t>(move));
      }
    }
    return combo::schema::verify_combo_t{.record = get_hash32(vm, "record"),
                                         .moves = std::move(moves)};
  }
  if (payload == "close_combo") {
    return combo::schema::close_combo_t{
        .record = get_hash32(vm, "record"),
        .destination = get_hash32(vm, "destination")};
  }
  combo::common::critical("unsupported payload type");
}

combo::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/engine/keyspaces") {
    return {};
  }
  if (path == "/state/combo") {
    return encoder.encode(get_hash32(vm, "record"));
  }
  if (path == "/state/combo_address") {
    return encoder.encode(get_hash32(vm, "owner"));
  }
  if (path == "/state/account") {
    return encoder.encode(get_hash32(vm, "account"));
  }
  if (path == "/history/range" || path == "/events/range") {
    return encoder.encode(
        std::tuple{vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>()});
  }
  combo::common::critical("unsupported query path");
}

combo::storage::storage<combo::storage::rocksdb_storage_tag> open_storage(
    const po::variables_map& vm) {
  auto path = vm["db-path"].as<std::string>();
  spdlog::debug("Opening RocksDB at '{}'", path);
  return combo::storage::make_storage<combo::storage::rocksdb_storage_tag>(
      path);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  combo_cli fingerprint --name N --damage D --meter-gain M "
               "--move-count C --character-id I\n"
            << "  combo_cli address --owner HEX\n"
            << "  combo_cli transaction --payload create_combo|verify_combo|"
               "close_combo --signer HEX [options]\n"
            << "  combo_cli fund --account HEX --lamports N\n"
            << "  combo_cli apply --height H --block-time T --tx BASE64...\n"
            << "  combo_cli query --path PATH [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"combo_cli options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "fingerprint|address|transaction|fund|apply|query")(
      "db-path", po::value<std::string>()->default_value("combo.db"),
      "RocksDB directory")("chain-id", po::value<std::string>(),
                           "32-byte chain id hex")(
      "log-file", po::value<std::string>(), "additional log file")(
      "verbose,v", "enable debug logging")(
      "payload", po::value<std::string>(),
      "create_combo|verify_combo|close_combo")(
      "signer", po::value<std::string>(), "signer identity hex")(
      "name", po::value<std::string>(), "combo name")(
      "damage", po::value<uint32_t>()->default_value(1), "combo damage")(
      "meter-gain", po::value<uint32_t>()->default_value(1),
      "combo meter gain")("move-count",
                          po::value<uint32_t>()->default_value(1),
                          "combo move count")(
      "character-id", po::value<uint32_t>()->default_value(0),
      "character id")("record", po::value<std::string>(),
                      "combo record address hex")(
      "move", po::value<std::vector<uint32_t>>()->multitoken(),
      "move ids of a verification attempt")(
      "destination", po::value<std::string>(), "reclaim destination hex")(
      "owner", po::value<std::string>(), "owner identity hex")(
      "account", po::value<std::string>(), "account identity hex")(
      "lamports", po::value<uint64_t>()->default_value(0),
      "lamports to credit")("height", po::value<uint64_t>()->default_value(1),
                            "block height")(
      "block-time", po::value<int64_t>()->default_value(0),
      "block time unix seconds")(
      "tx", po::value<std::vector<std::string>>()->multitoken(),
      "base64 transactions")("path", po::value<std::string>(), "query path")(
      "from", po::value<uint64_t>()->default_value(1), "range start")(
      "to", po::value<uint64_t>()->default_value(1), "range end");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }
  configure_logging(vm);

  auto exit_code = 0;
  if (command == "fingerprint") {
    auto request = build_create(vm);
    auto fingerprint = combo::fingerprint::compute_fingerprint(
        request.name, request.damage, request.meter_gain, request.move_count,
        request.character_id);
    std::cout << combo::schema::to_hex(fingerprint) << '\n';
  } else if (command == "address") {
    auto [address, bump] =
        combo::store::find_record_address(get_hash32(vm, "owner"));
    std::cout << combo::schema::to_hex(address) << ' '
              << static_cast<uint32_t>(bump) << '\n';
  } else if (command == "transaction" || command == "tx") {
    auto transaction =
        combo::schema::transaction_t{.version = 1,
                                     .chain_id = get_chain_id(vm),
                                     .signer = get_hash32(vm, "signer"),
                                     .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << combo::schema::to_base64(encoded) << '\n';
  } else if (command == "fund") {
    auto encoder = encoder_t{};
    auto storage = open_storage(vm);
    auto engine = combo::execution::engine{
        encoder, storage, {.chain_id = get_chain_id(vm)}};
    auto account = get_hash32(vm, "account");
    engine.credit(account, vm["lamports"].as<uint64_t>());
    auto key = encoder.encode(account);
    auto queried = engine.query("/state/account", key);
    auto lamports = combo::schema::lamports_t{0};
    if (queried.code == 0) {
      lamports = encoder.decode<combo::schema::account_t>(queried.value).lamports;
    }
    std::cout << lamports << '\n';
  } else if (command == "apply") {
    auto encoder = encoder_t{};
    auto storage = open_storage(vm);
    auto engine = combo::execution::engine{
        encoder, storage, {.chain_id = get_chain_id(vm)}};
    auto txs = std::vector<combo::schema::bytes_t>{};
    if (vm.contains("tx")) {
      for (const auto& encoded : vm["tx"].as<std::vector<std::string>>()) {
        txs.push_back(combo::schema::from_base64(encoded));
      }
    }
    auto block = engine.finalize_block(vm["height"].as<uint64_t>(),
                                       vm["block-time"].as<int64_t>(), txs);
    engine.commit();
    for (size_t i = 0; i < block.tx_results.size(); ++i) {
      const auto& result = block.tx_results[i];
      std::cout << i << ' ' << result.code << ' '
                << (result.code == 0 ? result.info : result.log) << '\n';
      if (result.code != 0) {
        exit_code = 1;
      }
    }
    std::cout << combo::schema::to_hex(block.state_root) << '\n';
  } else if (command == "query") {
    if (!vm.contains("path")) {
      combo::common::critical("query mode requires --path");
    }
    auto encoder = encoder_t{};
    auto storage = open_storage(vm);
    auto engine = combo::execution::engine{
        encoder, storage, {.chain_id = get_chain_id(vm)}};
    auto key = build_query_key(vm);
    auto result = engine.query(vm["path"].as<std::string>(), key);
    if (result.code != 0) {
      std::cout << result.code << ' ' << result.log << '\n';
      exit_code = 1;
    } else {
      std::cout << combo::schema::to_base64(result.value) << '\n';
    }
  } else {
    combo::common::critical(
        "command must be fingerprint|address|transaction|fund|apply|query");
  }

  spdlog::shutdown();
  return exit_code;
}
