#include <ballot/etcd_coordination_client.hpp>
#include <ballot/leader_election.hpp>
#include <ballot/log.hpp>

#include <csignal>
#include <iostream>

namespace {
volatile std::sig_atomic_t interrupt = 0;
extern "C" void signal_handler(int sig) {
  interrupt = 1;
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  using namespace std::chrono_literals;

  if (argc < 3 or argc > 5) {
    std::cerr << "Usage: " << argv[0] << " <path> <identity> [etcd-address] [log-level]" << std::endl;
    return 1;
  }
  std::string path = argv[1];
  std::string identity = argv[2];
  char const* etcd_address = argc >= 4 ? argv[3] : "localhost:2379";
  auto min_severity = argc == 5 ? ballot::parse_severity(argv[4]) : ballot::severity::info;

  ballot::log::instance().min_severity(min_severity);
  ballot::log::instance().add_sink(
      ballot::make_log_sink([](ballot::severity sev, std::string&& x) { std::cerr << x << std::endl; }));

  auto etcd_channel = grpc::CreateChannel(etcd_address, grpc::InsecureChannelCredentials());
  auto queue = std::make_shared<ballot::active_completion_queue>();
  auto client = std::make_shared<ballot::etcd_coordination_client>(queue, etcd_channel, 5s);

  // ... the callbacks run in the completion queue thread, std::cout is good enough for a demo ...
  ballot::listener_callbacks callbacks;
  callbacks.on_state_changed = [](ballot::leader_election& e, ballot::election_state o, ballot::election_state n) {
    std::cout << "state changed " << o << " -> " << n << std::endl;
  };
  callbacks.on_win = [](ballot::leader_election& e) {
    std::cout << "[" << e.identity() << "] is the leader for " << e.path() << std::endl;
  };
  callbacks.on_lose = [](ballot::leader_election& e) {
    std::cout << "[" << e.identity() << "] lost the election for " << e.path() << std::endl;
  };
  callbacks.on_vacant = [](ballot::leader_election& e) {
    std::cout << "no leader for " << e.path() << ", trying again" << std::endl;
  };
  callbacks.on_finish = [](ballot::leader_election& e) {
    std::cout << "[" << e.identity() << "] left the election" << std::endl;
  };

  auto candidate = ballot::leader_election::create(client);
  candidate->path(path).identity(identity).listener(ballot::make_election_listener(std::move(callbacks)));

  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);
  candidate->start();

  // ... wait until the user interrupts the program, or the session is lost ...
  while (interrupt == 0 and candidate->state() != ballot::election_state::done) {
    std::this_thread::sleep_for(20ms);
  }

  candidate->finish();
  // ... the candidate keeps its node until the session ends, release it promptly ...
  if (client->state() != ballot::client_state::closed) {
    client->revoke();
  }
  client->shutdown();
  return 0;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
