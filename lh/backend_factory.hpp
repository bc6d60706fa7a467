#ifndef lh_backend_factory_hpp
#define lh_backend_factory_hpp

#include <lh/document_store.hpp>
#include <lh/storage_backend.hpp>
#include <lh/ttl_key_store.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace lh {

/**
 * Create the backend for a new election.
 *
 * The election engine calls the factory once per election, this is the only place where the kind of backend is
 * examined.
 */
using backend_factory = std::function<std::unique_ptr<storage_backend>(backend_kind)>;

/**
 * Create a factory for the two standard backends.
 *
 * Either store may be null, in which case asking for the corresponding backend raises std::invalid_argument.
 */
backend_factory make_backend_factory(
    std::shared_ptr<document_store> documents, std::shared_ptr<ttl_key_store> keys,
    std::chrono::milliseconds lease_duration);

} // namespace lh

#endif // lh_backend_factory_hpp
