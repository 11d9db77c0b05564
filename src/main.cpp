#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <credence/config/policy_config.hpp>
#include <credence/execution/engine.hpp>
#include <credence/fingerprint/canonical.hpp>
#include <credence/receipts/signer.hpp>
#include <credence/schema/credit_error_code.hpp>
#include <credence/schema/json.hpp>
#include <credence/storage/rocksdb/storage.hpp>

#include <fstream>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

template <typename T>
int print_report(const credence::schema::credit_result_t<T>& result) {
  if (!result.ok()) {
    spdlog::error("{} failed ({}): {}", result.codespace,
                  credence::schema::to_string(result.code), result.log);
    return 1;
  }
  std::cout << credence::fingerprint::canonical_json(
                   credence::schema::to_json(*result.value))
            << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("credenced.log",
                                                          false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "credence", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto config_path = std::string{};
  auto log_level = std::string{};
  auto signing_key = std::string{};
  auto agent_id = std::string{};
  auto policy = credence::config::policy_config{};

  auto general = po::options_description{"Credence"};
  general.add_options()("help,h", "Show the help message")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("credence.db"),
      "RocksDB directory holding the credit store")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with policy options")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "receipt-signing-key", po::value<std::string>(&signing_key),
      "Hex Ed25519 secret key used to sign receipts")(
      "health", "Print the pool health report")(
      "exposure", po::value<std::string>(&agent_id),
      "Print the exposure report for an agent public key");

  auto policy_options = credence::config::make_options_description(policy);
  auto description = po::options_description{};
  description.add(general).add(policy_options);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto stream = std::ifstream{path};
      if (!stream) {
        spdlog::error("Cannot open config file {}", path);
        spdlog::shutdown();
        return 1;
      }
      po::store(po::parse_config_file(stream, policy_options), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    spdlog::error("Invalid options: {}", ex.what());
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  auto level = credence::config::parse_log_level(log_level);
  if (!level) {
    spdlog::error("Unknown log level '{}'", log_level);
    spdlog::shutdown();
    return 1;
  }
  spdlog::set_level(*level);

  if (auto problem = credence::config::validate(policy)) {
    spdlog::error("Invalid policy: {}", *problem);
    spdlog::shutdown();
    return 1;
  }

  auto signer = credence::receipts::receipt_signer{};
  if (!signing_key.empty()) {
    auto parsed = credence::receipts::receipt_signer::from_secret_hex(
        signing_key);
    if (!parsed) {
      spdlog::error("--receipt-signing-key must be 64 hex characters");
      spdlog::shutdown();
      return 1;
    }
    signer = std::move(*parsed);
  }

  auto storage = credence::storage::make_storage<
      credence::storage::rocksdb_storage_tag>(db_path);
  auto engine =
      credence::execution::engine{storage, policy, std::move(signer)};

  auto status = 0;
  if (vm.contains("health")) {
    status = print_report(engine.health());
  } else if (vm.contains("exposure")) {
    status = print_report(engine.agent_exposure(agent_id));
  } else {
    std::cout << description << std::endl;
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
