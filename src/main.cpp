#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tally/blake3/hash.hpp>
#include <tally/common/critical.hpp>
#include <tally/execution/engine.hpp>
#include <tally/schema/genesis_config.hpp>
#include <tally/schema/stake_projection.hpp>
#include <tally/schema/transaction.hpp>
#include <tally/schema/transaction_error_code.hpp>
#include <tally/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace po = boost::program_options;

namespace {

using encoder_t = tally::execution::encoder_t;

void init_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "tally", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(level));
}

tally::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    spdlog::error("missing required argument --{}", name);
    tally::common::critical("missing required hash argument");
  }
  auto parsed = tally::schema::try_make_hash32(vm[name].as<std::string>());
  if (!parsed) {
    spdlog::error("--{} must be 32 bytes of hex", name);
    tally::common::critical("malformed hash argument");
  }
  return *parsed;
}

std::optional<tally::schema::hash32_t> get_optional_hash32(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return get_hash32(vm, name);
}

std::vector<tally::schema::account_id_t> get_accounts(
    const po::variables_map& vm,
    const std::string& name) {
  auto accounts = std::vector<tally::schema::account_id_t>{};
  if (!vm.contains(name)) {
    return accounts;
  }
  for (const auto& value : vm[name].as<std::vector<std::string>>()) {
    auto parsed = tally::schema::try_make_hash32(value);
    if (!parsed) {
      spdlog::error("--{} entry '{}' is not 32 bytes of hex", name, value);
      tally::common::critical("malformed account argument");
    }
    accounts.push_back(*parsed);
  }
  return accounts;
}

tally::schema::bytes_t get_hex_bytes(const po::variables_map& vm,
                                     const std::string& name) {
  auto decoded = tally::schema::try_from_hex(vm[name].as<std::string>());
  if (!decoded) {
    spdlog::error("--{} is not valid hex", name);
    tally::common::critical("malformed hex argument");
  }
  return *decoded;
}

tally::schema::signer_id_t make_signer(const po::variables_map& vm) {
  auto hash = get_hash32(vm, "signer");
  if (vm["signer-kind"].as<std::string>() == "ed25519") {
    return tally::schema::signer_id_t{
        tally::schema::ed25519_signer_id{.public_key = hash}};
  }
  return tally::schema::signer_id_t{hash};
}

tally::schema::signature_t make_signature(const po::variables_map& vm) {
  auto signature = tally::schema::ed25519_signature_t{};
  if (vm["signature-hex"].as<std::string>().empty()) {
    return tally::schema::signature_t{signature};
  }
  auto bytes = get_hex_bytes(vm, "signature-hex");
  if (bytes.size() != signature.size()) {
    tally::common::critical("ed25519 signature must be 64 bytes");
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
  return tally::schema::signature_t{signature};
}

tally::schema::capability_t parse_capability(const std::string& value) {
  auto capability =
      tally::schema::try_from_string<tally::schema::capability_t>(value);
  if (!capability) {
    tally::common::critical("capability must be governance|custody_operator");
  }
  return *capability;
}

std::optional<tally::schema::bytes_t> get_label(const po::variables_map& vm) {
  if (!vm.contains("label")) {
    return std::nullopt;
  }
  return tally::schema::make_bytes(vm["label"].as<std::string>());
}

tally::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_vault") {
    return tally::schema::create_vault_t{.vault_id = get_hash32(vm, "vault-id"),
                                         .asset_id = get_hash32(vm, "asset-id"),
                                         .label = get_label(vm)};
  }
  if (payload == "deposit") {
    return tally::schema::deposit_t{.vault_id = get_hash32(vm, "vault-id"),
                                    .asset_id = get_hash32(vm, "asset-id"),
                                    .amount = vm["amount"].as<uint64_t>()};
  }
  if (payload == "withdraw") {
    return tally::schema::withdraw_t{.vault_id = get_hash32(vm, "vault-id"),
                                     .amount = vm["amount"].as<uint64_t>(),
                                     .recipient = get_hash32(vm, "recipient")};
  }
  if (payload == "destroy_vault") {
    return tally::schema::destroy_vault_t{.vault_id = get_hash32(vm, "vault-id")};
  }
  if (payload == "open_stake") {
    return tally::schema::open_stake_t{
        .vault_id = get_hash32(vm, "vault-id"),
        .asset_id = get_hash32(vm, "asset-id"),
        .principal = vm["amount"].as<uint64_t>(),
        .lock_epochs = vm["lock-epochs"].as<uint64_t>()};
  }
  if (payload == "settle_stake") {
    return tally::schema::settle_stake_t{.stake_id = get_hash32(vm, "stake-id")};
  }
  if (payload == "close_stake") {
    return tally::schema::close_stake_t{
        .stake_id = get_hash32(vm, "stake-id"),
        .recipient = get_optional_hash32(vm, "recipient")};
  }
  if (payload == "set_rate") {
    return tally::schema::set_rate_t{
        .apy_basis_points = vm["apy-bps"].as<uint32_t>()};
  }
  if (payload == "set_paused") {
    return tally::schema::set_paused_t{.paused = vm["paused"].as<bool>(),
                                       .reason = get_label(vm)};
  }
  if (payload == "upsert_capability") {
    return tally::schema::upsert_capability_t{
        .subject = get_hash32(vm, "subject"),
        .capability = parse_capability(vm["capability"].as<std::string>()),
        .enabled = vm["enabled"].as<bool>()};
  }
  tally::common::critical("unsupported payload type");
}

tally::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/state/config" ||
      path == "/state/mode") {
    return {};
  }
  if (path == "/state/vault" || path == "/view/vault") {
    return encoder.encode(get_hash32(vm, "vault-id"));
  }
  if (path == "/state/stake") {
    return encoder.encode(get_hash32(vm, "stake-id"));
  }
  if (path == "/view/stake") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "stake-id"), vm["epoch"].as<uint64_t>()});
  }
  if (path == "/state/nonce") {
    return encoder.encode(make_signer(vm));
  }
  if (path == "/state/capability") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "subject"),
                   parse_capability(vm["capability"].as<std::string>())});
  }
  if (path == "/history/range" || path == "/events/range") {
    return encoder.encode(
        std::tuple{vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>()});
  }
  tally::common::critical("unsupported query path");
}

tally::schema::genesis_config_t build_genesis(const po::variables_map& vm) {
  return tally::schema::genesis_config_t{
      .chain_id = tally::blake3::hash(vm["chain-name"].as<std::string>()),
      .rate =
          tally::schema::rate_config_t{
              .apy_basis_points = vm["apy-bps"].as<uint32_t>(),
              .max_apy_basis_points = vm["max-apy-bps"].as<uint32_t>(),
              .epochs_per_year = vm["epochs-per-year"].as<uint64_t>()},
      .governance = get_accounts(vm, "governance"),
      .custody_operators = get_accounts(vm, "custody-operator")};
}

void print_projection(const tally::schema::stake_projection_t& projection) {
  std::cout << "stake            "
            << tally::schema::to_hex(projection.stake_id) << '\n'
            << "status           " << tally::schema::to_string(projection.status)
            << '\n'
            << "principal        " << projection.principal << '\n'
            << "settled points   " << projection.settled_points << '\n'
            << "pending points   " << projection.pending_points << '\n'
            << "projected points " << projection.projected_points << '\n'
            << "last settled     " << projection.last_settled_epoch << '\n'
            << "as of epoch      " << projection.as_of_epoch << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  tally tx --payload <type> [options]\n"
            << "  tally apply --db <path> --epoch <n> --tx <base64>...\n"
            << "  tally query --db <path> --path <route> [options]\n"
            << "  tally project --db <path> --stake-id <hex> --epoch <n>\n"
            << "  tally query-key --path <route> [options]\n"
            << "  tally chain-id [--chain-name <name>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto config_file = std::string{};

  auto general = po::options_description{"general"};
  general.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "tx|apply|query|project|query-key|chain-id")(
      "config", po::value<std::string>(&config_file), "ini configuration file");

  auto runtime = po::options_description{"runtime"};
  runtime.add_options()("db", po::value<std::string>()->default_value("tally.db"),
                        "RocksDB directory")(
      "strict-crypto", po::value<bool>()->default_value(true),
      "verify ed25519 signatures with OpenSSL")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value("tally.log"),
      "log file path");

  auto genesis = po::options_description{"genesis"};
  genesis.add_options()(
      "chain-name", po::value<std::string>()->default_value("tally-local"),
      "chain id seed; the chain id is its BLAKE3 hash")(
      "apy-bps", po::value<uint32_t>()->default_value(500),
      "annual yield in basis points")(
      "max-apy-bps", po::value<uint32_t>()->default_value(2000),
      "upper bound for governance rate changes")(
      "epochs-per-year", po::value<uint64_t>()->default_value(365),
      "accrual epochs per year")(
      "governance", po::value<std::vector<std::string>>()->multitoken(),
      "governance account hash32 hex values")(
      "custody-operator", po::value<std::vector<std::string>>()->multitoken(),
      "custody operator account hash32 hex values");

  auto transaction = po::options_description{"transaction"};
  transaction.add_options()("payload", po::value<std::string>(),
                            "transaction payload type")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "signer hash32 hex")(
      "signer-kind", po::value<std::string>()->default_value("named"),
      "named|ed25519")("signature-hex",
                       po::value<std::string>()->default_value(""),
                       "ed25519 signature bytes hex")(
      "vault-id", po::value<std::string>(), "vault hash32 hex")(
      "asset-id", po::value<std::string>(), "asset hash32 hex")(
      "stake-id", po::value<std::string>(), "stake hash32 hex")(
      "recipient", po::value<std::string>(), "recipient account hash32 hex")(
      "subject", po::value<std::string>(), "capability subject hash32 hex")(
      "capability", po::value<std::string>()->default_value("custody_operator"),
      "governance|custody_operator")(
      "enabled", po::value<bool>()->default_value(true), "capability enabled")(
      "paused", po::value<bool>()->default_value(true), "pause flag")(
      "amount", po::value<uint64_t>()->default_value(0), "amount or principal")(
      "lock-epochs", po::value<uint64_t>()->default_value(0),
      "epochs before a stake may close")(
      "label", po::value<std::string>(), "vault label or pause reason")(
      "tx", po::value<std::vector<std::string>>()->multitoken(),
      "base64 transactions for apply")(
      "epoch", po::value<uint64_t>()->default_value(0), "block or view epoch")(
      "path", po::value<std::string>(), "query route")(
      "from", po::value<uint64_t>()->default_value(1), "range start")(
      "to", po::value<uint64_t>()->default_value(1), "range end");

  auto options = po::options_description{"tally options"};
  options.add(general).add(runtime).add(genesis).add(transaction);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    if (!config_file.empty()) {
      auto file_options = po::options_description{};
      file_options.add(runtime).add(genesis);
      po::store(po::parse_config_file<char>(config_file.c_str(), file_options),
                vm);
      po::notify(vm);
    }
  } catch (const po::error& ex) {
    std::cerr << "tally: " << ex.what() << '\n';
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  init_logging(vm["log-level"].as<std::string>(),
               vm["log-file"].as<std::string>());

  if (command == "tx") {
    if (!vm.contains("payload")) {
      tally::common::critical("tx mode requires --payload");
    }
    auto tx = tally::schema::transaction_t{
        .version = 1,
        .chain_id = tally::blake3::hash(vm["chain-name"].as<std::string>()),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = make_signer(vm),
        .payload = build_payload(vm),
        .signature = make_signature(vm)};
    if (vm["signature-hex"].as<std::string>().empty()) {
      auto signing = tally::execution::make_signing_payload(tx);
      spdlog::info("Unsigned transaction; signing payload {}",
                   tally::schema::to_hex(signing));
    }
    std::cout << tally::schema::to_base64(encoder_t{}.encode(tx)) << '\n';
    spdlog::shutdown();
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      tally::common::critical("query-key mode requires --path");
    }
    std::cout << tally::schema::to_base64(build_query_key(vm)) << '\n';
    spdlog::shutdown();
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = tally::blake3::hash(vm["chain-name"].as<std::string>());
    std::cout << tally::schema::to_hex(chain_id) << '\n';
    spdlog::shutdown();
    return 0;
  }

  if (command != "apply" && command != "query" && command != "project") {
    tally::common::critical(
        "command must be tx|apply|query|project|query-key|chain-id");
  }

  auto encoder = encoder_t{};
  auto storage =
      tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(
          vm["db"].as<std::string>());
  auto engine = tally::execution::engine{encoder, storage, build_genesis(vm),
                                         vm["strict-crypto"].as<bool>()};
  auto exit_code = 0;

  if (command == "apply") {
    auto txs = std::vector<tally::schema::bytes_t>{};
    if (vm.contains("tx")) {
      for (const auto& value : vm["tx"].as<std::vector<std::string>>()) {
        auto decoded = tally::schema::try_from_base64(value);
        if (!decoded) {
          tally::common::critical("--tx value is not valid base64");
        }
        txs.push_back(std::move(*decoded));
      }
    }
    auto height = static_cast<uint64_t>(engine.info().last_block_height) + 1;
    auto block = engine.finalize_block(height, vm["epoch"].as<uint64_t>(), txs);
    auto committed = engine.commit();
    for (size_t i = 0; i < block.tx_results.size(); ++i) {
      const auto& result = block.tx_results[i];
      std::cout << "tx " << i << ": code=" << result.code;
      if (!result.log.empty()) {
        std::cout << " log=\"" << result.log << '"';
      }
      if (!result.info.empty()) {
        std::cout << " info=\"" << result.info << '"';
      }
      std::cout << '\n';
      for (const auto& event : result.events) {
        std::cout << "  " << event.type;
        for (const auto& attribute : event.attributes) {
          std::cout << ' ' << attribute.key << '=' << attribute.value;
        }
        std::cout << '\n';
      }
      if (result.code != 0) {
        exit_code = 1;
      }
    }
    std::cout << "height " << committed.committed_height << " epoch "
              << committed.committed_epoch << " root "
              << tally::schema::to_hex(committed.state_root) << '\n';
  } else if (command == "query") {
    if (!vm.contains("path")) {
      tally::common::critical("query mode requires --path");
    }
    auto key = build_query_key(vm);
    auto result = engine.query(vm["path"].as<std::string>(),
                               tally::schema::bytes_view_t{key.data(), key.size()});
    if (result.code != 0) {
      std::cerr << result.codespace << " code " << result.code << ": "
                << result.log << '\n';
      exit_code = 1;
    } else {
      std::cout << tally::schema::to_base64(result.value) << '\n';
    }
  } else {
    auto key = encoder.encode(
        std::tuple{get_hash32(vm, "stake-id"), vm["epoch"].as<uint64_t>()});
    auto result = engine.query("/view/stake", tally::schema::bytes_view_t{
                                                  key.data(), key.size()});
    if (result.code != 0) {
      std::cerr << result.codespace << " code " << result.code << ": "
                << result.log << '\n';
      exit_code = 1;
    } else {
      print_projection(encoder.decode<tally::schema::stake_projection_t>(
          tally::schema::bytes_view_t{result.value.data(),
                                      result.value.size()}));
    }
  }

  spdlog::shutdown();
  return exit_code;
}
