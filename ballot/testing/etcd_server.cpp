#include "ballot/testing/etcd_server.hpp"
#include <ballot/log.hpp>

#include <cstdlib>

namespace ballot {
namespace testing {

std::string etcd_address() {
  char const* address = std::getenv("BALLOT_ETCD_ADDRESS");
  if (address == nullptr or *address == '\0') {
    return "localhost:2379";
  }
  return address;
}

std::shared_ptr<grpc::Channel> connect_to_etcd(std::chrono::milliseconds timeout) {
  auto address = etcd_address();
  auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
  if (not channel->WaitForConnected(std::chrono::system_clock::now() + timeout)) {
    BALLOT_LOG(notice) << "no etcd server at " << address;
    return std::shared_ptr<grpc::Channel>();
  }
  return channel;
}

} // namespace testing
} // namespace ballot
