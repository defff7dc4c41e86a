#include "memory_repository.hpp"


#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace registry::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertRegistration(Transaction& t, model::RegistrationRecord& r) {
  auto& s   = TX(t).Mutable();
  auto  key = std::make_pair(r.eth_address, r.rgb_address);
  if (s.address_pairs.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "UNIQUE constraint failed: registrations.eth_address, registrations.rgb_address");
  }

  const auto now = registry::util::FormatIso8601(registry::util::Now());
  r.id           = s.next_id++;
  r.created_at   = now;
  r.updated_at   = now;

  s.address_pairs.insert(std::move(key));
  s.registrations[r.id] = r;
  return Result::Ok();
}

std::vector<model::RegistrationRecord> MemoryRepository::ListRegistrations(Transaction& t) {
  const auto& s = TX(t).View();
  std::vector<model::RegistrationRecord> records;
  records.reserve(s.registrations.size());
  for (const auto& [_, record] : s.registrations) {
    records.push_back(record);
  }
  return records;
}

void MemoryRepository::Close() {
  std::scoped_lock lock(mutex_);
  closed_ = true;
}

} // namespace registry::db::memory
