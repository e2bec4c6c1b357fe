#pragma once

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "holdem/holdem_service.grpc.pb.h"
#include "holdem/errors.hpp"
#include "server_config.hpp"
#include "table_registry.hpp"

namespace holdem {
namespace service {

/// gRPC front for the engine. Every call against a table runs under that table's lock.
class HoldemTableService final : public v1::HoldemTable::Service {
public:
    explicit HoldemTableService(const ServerConfig& config);

    grpc::Status CreateTable(grpc::ServerContext* context,
                             const v1::CreateTableRequest* request,
                             v1::TableResponse* response) override;

    grpc::Status CloseTable(grpc::ServerContext* context,
                            const v1::TableRequest* request,
                            v1::CloseTableResponse* response) override;

    grpc::Status JoinTable(grpc::ServerContext* context,
                           const v1::JoinTableRequest* request,
                           v1::JoinTableResponse* response) override;

    grpc::Status LeaveTable(grpc::ServerContext* context,
                            const v1::LeaveTableRequest* request,
                            v1::TableResponse* response) override;

    grpc::Status StartHand(grpc::ServerContext* context,
                           const v1::TableRequest* request,
                           v1::TableResponse* response) override;

    grpc::Status Act(grpc::ServerContext* context,
                     const v1::ActRequest* request,
                     v1::TableResponse* response) override;

    grpc::Status GetTable(grpc::ServerContext* context,
                          const v1::TableRequest* request,
                          v1::TableResponse* response) override;

    grpc::Status GetValidActions(grpc::ServerContext* context,
                                 const v1::TableRequest* request,
                                 v1::ValidActionsResponse* response) override;

    grpc::Status EvaluateHand(grpc::ServerContext* context,
                              const v1::EvaluateHandRequest* request,
                              v1::HandResultSnapshot* response) override;

    const TableRegistry& registry() const { return registry_; }

private:
    grpc::Status rejected(const std::string& command, const std::string& table_id,
                          const Rejection& rejection) const;

    TableRegistry registry_;
};

std::unique_ptr<HoldemTableService> create_holdem_service(const ServerConfig& config);

} // namespace service
} // namespace holdem
