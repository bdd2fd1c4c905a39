#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/factory.hpp"
#include "internal/grpc/audit_query_server.hpp"
#include "internal/grpc/gateway_server.hpp"
#include "internal/observability/logging.hpp"

namespace auditgate::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  AUDITGATE_LOG_INFO("gRPC server listening",
                     {observability::StringField("bind_address", bind_address_), observability::IntField("port", selected_port_)});
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    grpc_server_.reset();
  }
}

std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const auditgate::factory::Application& app) {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<auditgate::grpc::AuditQueryServer>(app.audit_query_service));
  services.push_back(std::make_unique<auditgate::grpc::GatewayServer>(app.gateway_service));
  return services;
}

} // namespace auditgate::runtime
