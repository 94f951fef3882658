#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <depot/execution/demo_seed.hpp>
#include <depot/execution/engine.hpp>
#include <depot/rpc/server.hpp>
#include <depot/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto db_path = std::string{};
  auto grpc_address = std::string{};
  auto config_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto utc_offset_minutes = int32_t{};
  auto lock_timeout_ms = int64_t{};
  auto max_code_attempts = uint32_t{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Depot"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "INI file with the same options; the command line wins")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "depot.db"),
      "RocksDB directory")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:50051"),
      "IP:Port for the requisition service")(
      "utc-offset-minutes",
      boost::program_options::value<int32_t>(&utc_offset_minutes)
          ->default_value(0),
      "Fixed offset used for the calendar day of requisition codes")(
      "lock-timeout-ms",
      boost::program_options::value<int64_t>(&lock_timeout_ms)
          ->default_value(1000),
      "Row lock wait before a transaction gives up")(
      "max-code-attempts",
      boost::program_options::value<uint32_t>(&max_code_attempts)
          ->default_value(8),
      "Attempts for a requisition creation under lock contention")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "depot.log"),
      "Log file path")("seed-demo", "Load demo data into an empty database")(
      "verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto config_file = std::ifstream{vm["config"].as<std::string>()};
      if (!config_file) {
        std::cerr << "Cannot open config file "
                  << vm["config"].as<std::string>() << std::endl;
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(config_file, description),
          vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "depot", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto level = spdlog::level::from_str(log_level);
  if (level == spdlog::level::off && log_level != "off") {
    spdlog::warn("Unknown log level '{}', using info", log_level);
    level = spdlog::level::info;
  }
  if (vm.contains("verbose")) {
    level = spdlog::level::debug;
  }
  spdlog::set_level(level);

  if (lock_timeout_ms <= 0) {
    spdlog::error("--lock-timeout-ms must be positive");
    spdlog::shutdown();
    return 1;
  }
  if (max_code_attempts == 0) {
    spdlog::error("--max-code-attempts must be positive");
    spdlog::shutdown();
    return 1;
  }

  auto storage = depot::storage::make_storage<depot::storage::rocksdb_storage_tag>(
      db_path, depot::storage::storage_options{.lock_timeout_ms = lock_timeout_ms,
                                               .create_if_missing = true});
  auto encoder = depot::store::encoder_t{};
  auto engine = depot::execution::engine{
      encoder, storage,
      depot::execution::engine_options{
          .utc_offset_minutes = utc_offset_minutes,
          .max_code_attempts = max_code_attempts}};

  if (vm.contains("seed-demo")) {
    if (depot::execution::seed_demo_data(engine)) {
      spdlog::info("Demo data loaded");
    } else {
      spdlog::info("Database already has users, demo data skipped");
    }
  }

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = depot::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
