#include "lh/memory_document_store.hpp"

namespace lh {

memory_document_store::memory_document_store()
    : mu_()
    , records_() {
}

bool memory_document_store::find_one_and_update(
    document_filter const& filter, proto::lease_record const& update, proto::lease_record* after) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = records_.find(filter.id);
  if (i == records_.end() or not filter.matches(i->second)) {
    return false;
  }
  if (not update.owner().empty()) {
    i->second.set_owner(update.owner());
  }
  i->second.set_expires_at(update.expires_at());
  i->second.set_updated_at(update.updated_at());
  if (after != nullptr) {
    *after = i->second;
  }
  return true;
}

void memory_document_store::insert_one(proto::lease_record const& record) {
  std::lock_guard<std::mutex> lock(mu_);
  auto r = records_.emplace(record.id(), record);
  if (not r.second) {
    throw duplicate_key_error("memory_document_store::insert_one() - duplicate key: " + record.id());
  }
}

bool memory_document_store::find_one(std::string const& id, proto::lease_record* record) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = records_.find(id);
  if (i == records_.end()) {
    return false;
  }
  if (record != nullptr) {
    *record = i->second;
  }
  return true;
}

bool memory_document_store::delete_one(std::string const& id) {
  std::lock_guard<std::mutex> lock(mu_);
  return records_.erase(id) != 0;
}

void memory_document_store::delete_all() {
  std::lock_guard<std::mutex> lock(mu_);
  records_.clear();
}

std::size_t memory_document_store::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_.size();
}

} // namespace lh
