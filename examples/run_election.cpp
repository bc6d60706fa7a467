#include <lh/election_engine.hpp>
#include <lh/log.hpp>
#include <lh/memory_document_store.hpp>
#include <lh/memory_ttl_key_store.hpp>
#ifdef LH_HAVE_ETCD
#include <lh/etcd_document_store.hpp>
#include <lh/etcd_ttl_key_store.hpp>
#endif // LH_HAVE_ETCD

#include <csignal>
#include <iostream>
#include <thread>

namespace {
bool interrupt = false;
extern "C" void signal_handler(int sig) {
  interrupt = true;
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  using namespace std::chrono_literals;

  if (argc < 2 or argc > 5) {
    std::cerr << "Usage: " << argv[0] << " <A|B> [seconds] [log-level] [etcd-address]" << std::endl;
    return 1;
  }
  auto kind = lh::parse_backend_kind(argv[1]);
  std::chrono::seconds duration(argc >= 3 ? std::stoi(argv[2]) : 30);
  auto threshold = argc >= 4 ? lh::parse_severity(argv[3]) : lh::severity::info;

  lh::log::instance().min_severity(threshold);
  lh::log::instance().add_sink(lh::make_stream_log_sink(std::cerr, threshold));

  lh::engine_config config;
  std::shared_ptr<lh::document_store> documents;
  std::shared_ptr<lh::ttl_key_store> keys;
  if (argc == 5) {
#ifdef LH_HAVE_ETCD
    auto etcd_channel = grpc::CreateChannel(argv[4], grpc::InsecureChannelCredentials());
    documents = std::make_shared<lh::etcd_document_store>(etcd_channel);
    keys = std::make_shared<lh::etcd_ttl_key_store>(etcd_channel);
#else
    std::cerr << argv[0] << " was built without etcd support" << std::endl;
    return 1;
#endif // LH_HAVE_ETCD
  } else {
    documents = std::make_shared<lh::memory_document_store>();
    keys = std::make_shared<lh::memory_ttl_key_store>();
  }

  lh::election_engine engine(
      config, lh::make_backend_factory(documents, keys, config.lease_duration), lh::make_stream_event_sink(std::cout));

  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);

  engine.start_election(kind);

  // ... run until the deadline or the user interrupts, crash whoever is leader halfway through ...
  auto const start = std::chrono::steady_clock::now();
  auto const halfway = start + duration / 2;
  auto const deadline = start + duration;
  bool crashed = false;
  while (not interrupt and std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(20ms);
    if (crashed or std::chrono::steady_clock::now() < halfway) {
      continue;
    }
    auto leader = engine.current_leader();
    if (leader.empty()) {
      continue;
    }
    std::cerr << "crashing the current leader: " << leader << std::endl;
    engine.crash_node(leader);
    crashed = true;
  }

  engine.stop_election();
  for (auto const& n : engine.nodes()) {
    std::cerr << n.id << " " << n.status << std::endl;
  }
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
