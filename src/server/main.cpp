#include "holdem/logging.hpp"
#include "service/holdem_service.hpp"
#include "service/server_config.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

int main(int /*argc*/, char** /*argv*/) {
    holdem::service::ServerConfig config;
    try {
        config = holdem::service::ServerConfig::from_env();
    } catch (const holdem::CommandRejectedError& e) {
        holdem::log_error("holdem", "invalid_configuration", {{"reason", e.what()}});
        return 1;
    }

    grpc::EnableDefaultHealthCheckService(true);

    auto service = holdem::service::create_holdem_service(config);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.listen_address(), grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        holdem::log_error("holdem", "server_start_failed", {{"address", config.listen_address()}});
        return 1;
    }

    holdem::log_info("holdem", "holdem_server_started",
                     {{"port", config.port},
                      {"max_tables", config.max_tables},
                      {"replayable_shuffle", config.shuffle_seed.has_value()}});

    server->Wait();

    return 0;
}
