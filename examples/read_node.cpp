#include <ballot/etcd_coordination_client.hpp>
#include <ballot/log.hpp>
#include <ballot/node_reader.hpp>

#include <csignal>
#include <future>
#include <iostream>

namespace {
volatile std::sig_atomic_t interrupt = 0;
extern "C" void signal_handler(int sig) {
  interrupt = 1;
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  using namespace std::chrono_literals;

  if (argc != 2 and argc != 3) {
    std::cerr << "Usage: " << argv[0] << " <path> [etcd-address]" << std::endl;
    return 1;
  }
  std::string path = argv[1];
  char const* etcd_address = argc == 2 ? "localhost:2379" : argv[2];

  ballot::log::instance().add_sink(
      ballot::make_log_sink([](ballot::severity sev, std::string&& x) { std::cerr << x << std::endl; }));

  auto etcd_channel = grpc::CreateChannel(etcd_address, grpc::InsecureChannelCredentials());
  auto queue = std::make_shared<ballot::active_completion_queue>();
  auto client = std::make_shared<ballot::etcd_coordination_client>(queue, etcd_channel, 5s);

  auto done = std::make_shared<std::promise<bool>>();
  auto fut = done->get_future();
  auto reader = ballot::node_reader::create(client);
  reader->path(path).listener(ballot::make_node_reader_listener(
      [done](ballot::node_reader& r, std::string const& data, ballot::node_stat const& stat) {
        std::cout << r.path() << " = " << data << " (revision=" << stat.mod_revision << ", owner=" << std::hex
                  << stat.ephemeral_owner << std::dec << ")" << std::endl;
        done->set_value(true);
      },
      [done](ballot::node_reader& r) {
        std::cout << "gave up waiting for " << r.path() << std::endl;
        done->set_value(false);
      }));

  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);
  reader->start();

  auto r = fut.wait_for(20ms);
  while (interrupt == 0 and r != std::future_status::ready) {
    r = fut.wait_for(20ms);
  }
  bool found = r == std::future_status::ready and fut.get();

  reader->finish();
  client->revoke();
  client->shutdown();
  return found ? 0 : 1;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
