#include "internal/core/registration_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace registry::core {

using registry::db::ErrorCode;
using registry::observability::IntField;
using registry::observability::StringField;

RegistrationStore::RegistrationStore(std::shared_ptr<registry::db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("registration store requires a repository");
  }
  repository_->EnsureSchema();
}

RegistrationStore::~RegistrationStore() {
  try {
    Close();
  } catch (const std::exception& e) {
    REGISTRY_LOG_ERROR("Registration store close failed", {StringField("error", e.what())});
  }
}

InsertResult RegistrationStore::Insert(const std::string& eth_address, const std::string& rgb_address, const std::string& signature,
                                       const std::string& message) {
  if (closed_) {
    return InsertResult::StoreFailure("registration store is closed");
  }

  registry::db::model::RegistrationRecord record;
  record.eth_address = eth_address;
  record.rgb_address = rgb_address;
  record.signature   = signature;
  record.message     = message;

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertRegistration(*tx, record);
    if (result.code == ErrorCode::AlreadyExists) {
      // tx rolls back on destruction
      return InsertResult::Conflict();
    }
    if (!result) {
      return InsertResult::StoreFailure(std::string(registry::db::ToString(result.code)) + ": " + result.message);
    }
    tx->Commit();
  } catch (const std::exception& e) {
    return InsertResult::StoreFailure(e.what());
  }

  REGISTRY_LOG_DEBUG("Registration row written", {IntField("id", record.id), StringField("created_at", record.created_at)});
  return InsertResult::Created(record.id);
}

std::vector<registry::db::model::RegistrationRecord> RegistrationStore::ListAll() {
  if (closed_) {
    throw registry::util::StoreUnavailable("list registrations: registration store is closed");
  }

  try {
    auto tx      = repository_->Begin();
    auto records = repository_->ListRegistrations(*tx);
    tx->Commit();
    return records;
  } catch (const std::exception& e) {
    throw registry::util::StoreUnavailable(std::string("list registrations: ") + e.what());
  }
}

void RegistrationStore::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  repository_->Close();
  REGISTRY_LOG_INFO("Registration store closed");
}

} // namespace registry::core
