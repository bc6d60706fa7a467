#include "lh/document_store.hpp"

namespace lh {

bool document_filter::matches(proto::lease_record const& record) const {
  if (record.id() != id) {
    return false;
  }
  if (match_owner and record.owner() != owner) {
    return false;
  }
  if (match_expired and record.expires_at() != 0 and record.expires_at() >= to_epoch_ms(expired_before)) {
    return false;
  }
  return true;
}

} // namespace lh
