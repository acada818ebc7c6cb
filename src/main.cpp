#include <atomic>
#include <chrono>
#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <waybill/ledger/delivery_ledger.hpp>
#include <waybill/ledger/ledger_context.hpp>
#include <waybill/ledger/query_service.hpp>
#include <waybill/ledger/role_registry.hpp>
#include <waybill/rpc/server.hpp>
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

  auto grpc_port = std::string{};
  auto db_path = std::string{};
  auto owner = std::string{};
  auto genesis_time = uint64_t{};
  auto log_level = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Waybill"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-port,g",
      boost::program_options::value<std::string>(&grpc_port)
          ->default_value("0.0.0.0:26659"),
      "IP:Port for the ledger gRPC service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "waybill.db"),
      "RocksDB data directory")(
      "owner,o", boost::program_options::value<std::string>(&owner),
      "Ledger owner identity; required the first time a data directory is "
      "opened")(
      "genesis-time",
      boost::program_options::value<uint64_t>(&genesis_time)
          ->default_value(waybill::ledger::kDefaultGenesisTime),
      "Initial logical clock value")(
      "log-level,l",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "waybill.log"),
      "Log file path");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "waybill", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto encoder = waybill::ledger::encoder_t{};
  auto storage =
      waybill::storage::make_storage<waybill::storage::rocksdb_storage_tag>(
          db_path);
  auto context = waybill::ledger::ledger_context{
      encoder, storage,
      waybill::ledger::ledger_options{.owner = owner,
                                      .genesis_time = genesis_time}};
  auto roles = waybill::ledger::role_registry{context};
  auto ledger = waybill::ledger::delivery_ledger{context, roles};
  auto queries = waybill::ledger::query_service{context, roles};

  spdlog::info("Ledger service listening on {}", grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener =
      waybill::rpc::listener{context, roles, ledger, queries};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_port);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
