#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace auditgate::factory {
struct Application;
}

namespace auditgate::runtime {

class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  // Port chosen by the OS when bind_address ends in ":0"; 0 before Start().
  int SelectedPort() const {
    return selected_port_;
  }

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int selected_port_ = 0;
};

// gRPC adapters over the application's services.
std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const auditgate::factory::Application& app);

} // namespace auditgate::runtime
