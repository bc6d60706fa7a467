/**
 * Demonstrate why renewing a lease with a read followed by a refresh is unsafe.
 *
 * The TTL key backend renews by reading the key, comparing the owner, and then refreshing the expiration.  If the
 * lease expires and another node acquires it between the read and the refresh, the old leader extends the lease of
 * the new leader and believes it is still the leader.  The conditional write backend renews with a single conditional
 * update, so the same timeline makes the old leader step down.
 *
 * This program replays that timeline with in-process stores and a manual clock, no threads are involved.
 */
#include <lh/conditional_write_backend.hpp>
#include <lh/log.hpp>
#include <lh/memory_document_store.hpp>
#include <lh/memory_ttl_key_store.hpp>
#include <lh/ttl_key_backend.hpp>

#include <functional>
#include <iostream>

namespace {
/// A ttl_key_store that runs a hook right after each get(), to inject the competing writes.
class interleaving_ttl_key_store : public lh::ttl_key_store {
public:
  explicit interleaving_ttl_key_store(std::shared_ptr<lh::memory_ttl_key_store> store)
      : store_(std::move(store)) {
  }

  void after_get(std::function<void()> hook) {
    hook_ = std::move(hook);
  }

  bool set_if_absent(std::string const& key, std::string const& value, std::chrono::milliseconds ttl) override {
    return store_->set_if_absent(key, value, ttl);
  }
  bool get(std::string const& key, std::string* value) override {
    auto r = store_->get(key, value);
    if (hook_) {
      auto hook = std::move(hook_);
      hook_ = nullptr;
      hook();
    }
    return r;
  }
  bool expire(std::string const& key, std::chrono::milliseconds ttl) override {
    return store_->expire(key, ttl);
  }
  bool remove(std::string const& key) override {
    return store_->remove(key);
  }

private:
  std::shared_ptr<lh::memory_ttl_key_store> store_;
  std::function<void()> hook_;
};

char const* verdict(bool renewed) {
  return renewed ? "renewed, still believes it is the leader" : "renewal failed, steps down";
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  using namespace std::chrono_literals;

  lh::log::instance().add_sink(lh::make_stream_log_sink(std::cerr, lh::severity::info));

  // ... all the stores share a manual clock, the demo moves it explicitly ...
  auto now = std::make_shared<lh::clock_type::time_point>(lh::from_epoch_ms(1500000000000));
  lh::clock_function clock = [now]() { return *now; };
  auto const lease = 10000ms;

  std::cout << "ttl-key backend:" << std::endl;
  {
    auto memory = std::make_shared<lh::memory_ttl_key_store>(clock);
    auto store = std::make_shared<interleaving_ttl_key_store>(memory);
    lh::ttl_key_backend node1(store, lease);
    lh::ttl_key_backend node2(store, lease);
    node1.reset();

    std::cout << "  t=0      node-1 acquires: " << std::boolalpha << node1.try_acquire("node-1", clock()) << std::endl;

    // ... node-1 is slow to renew, it reads the key just before the lease expires, and the lease expires before it
    // can refresh it ...
    *now += lease - 1ms;
    store->after_get([&]() {
      *now += 2ms;
      std::cout << "  t=10001  node-2 acquires: " << node2.try_acquire("node-2", clock()) << std::endl;
    });
    auto const renewed = node1.renew("node-1", clock());
    std::cout << "  t=10001  node-1 " << verdict(renewed) << std::endl;

    std::string owner;
    memory->get("leader", &owner);
    auto const remaining = memory->expiration("leader") - clock();
    std::cout << "  the key is owned by " << owner << ", it expires in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(remaining).count() << "ms" << std::endl;
    if (renewed) {
      std::cout << "  two nodes believe they are the leader" << std::endl;
    }
  }

  std::cout << "conditional-write backend:" << std::endl;
  {
    *now = lh::from_epoch_ms(1500000000000);
    auto store = std::make_shared<lh::memory_document_store>();
    lh::conditional_write_backend node1(store, lease);
    lh::conditional_write_backend node2(store, lease);
    node1.reset();

    std::cout << "  t=0      node-1 acquires: " << std::boolalpha << node1.try_acquire("node-1", clock()) << std::endl;
    *now += lease + 1ms;
    std::cout << "  t=10001  node-2 acquires: " << node2.try_acquire("node-2", clock()) << std::endl;
    std::cout << "  t=10001  node-1 " << verdict(node1.renew("node-1", clock())) << std::endl;
  }

  return 0;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
