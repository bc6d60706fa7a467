#include "lh/backend_factory.hpp"
#include <lh/conditional_write_backend.hpp>
#include <lh/ttl_key_backend.hpp>

#include <sstream>
#include <stdexcept>

namespace lh {

namespace {
[[noreturn]] void missing_store(backend_kind kind) {
  std::ostringstream os;
  os << "make_backend_factory() - no store configured for backend " << kind;
  throw std::invalid_argument(os.str());
}
} // anonymous namespace

backend_factory make_backend_factory(
    std::shared_ptr<document_store> documents, std::shared_ptr<ttl_key_store> keys,
    std::chrono::milliseconds lease_duration) {
  return [documents, keys, lease_duration](backend_kind kind) -> std::unique_ptr<storage_backend> {
    switch (kind) {
    case backend_kind::conditional_write:
      if (not documents) {
        missing_store(kind);
      }
      return std::make_unique<conditional_write_backend>(documents, lease_duration);
    case backend_kind::ttl_key:
      if (not keys) {
        missing_store(kind);
      }
      return std::make_unique<ttl_key_backend>(keys, lease_duration);
    }
    missing_store(kind);
  };
}

} // namespace lh
