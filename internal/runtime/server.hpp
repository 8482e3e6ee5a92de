#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace vidpipe::runtime {

class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<grpc::Service>> services,
         uint32_t max_message_bytes = 0);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Actual port after Start(), useful with "host:0".
  int Port() const {
    return selected_port_;
  }

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  uint32_t max_message_bytes_;
  int selected_port_ = 0;
  std::unique_ptr<grpc::Server> grpc_server_;
};

} // namespace vidpipe::runtime
