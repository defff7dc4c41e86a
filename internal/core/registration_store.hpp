#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/registration_record.hpp"

namespace registry::core {

struct InsertResult {
  enum class Outcome {
    kCreated,
    kConflict,
    kStoreFailure,
  };

  Outcome     outcome = Outcome::kStoreFailure;
  int64_t     id      = 0;
  std::string cause;

  static InsertResult Created(int64_t id) {
    return {Outcome::kCreated, id, {}};
  }

  static InsertResult Conflict() {
    return {Outcome::kConflict, 0, {}};
  }

  static InsertResult StoreFailure(std::string cause) {
    return {Outcome::kStoreFailure, 0, std::move(cause)};
  }
};

/*
  Owner of all registration records.

  - One instance per process, shared by all request threads.
  - Uniqueness of (eth_address, rgb_address) is enforced by the backend's
    constraint inside a single transaction; there is no existence check
    before the write.
  - Never retries. A failed insert is reported, not repeated.
*/
class RegistrationStore {
 public:
  // Ensures the schema exists. Throws if the backend cannot be initialized.
  explicit RegistrationStore(std::shared_ptr<registry::db::Repository> repository);
  ~RegistrationStore();

  RegistrationStore(const RegistrationStore&)            = delete;
  RegistrationStore& operator=(const RegistrationStore&) = delete;

  InsertResult Insert(const std::string& eth_address, const std::string& rgb_address, const std::string& signature,
                      const std::string& message);

  // Full snapshot in ascending id order. Throws util::StoreUnavailable.
  std::vector<registry::db::model::RegistrationRecord> ListAll();

  // Makes prior writes durable and releases the backend. Safe to call twice.
  void Close();

  bool IsClosed() const {
    return closed_.load();
  }

 private:
  std::shared_ptr<registry::db::Repository> repository_;
  std::atomic<bool>                         closed_{false};
};

} // namespace registry::core
