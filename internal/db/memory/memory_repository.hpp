#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace registry::db::memory {

class MemoryTransaction;

/*
  Volatile repository with the same uniqueness and ordering guarantees
  as the SQLite backend. Transactions are serialized on mutex_.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  void EnsureSchema() override {}

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRegistration(Transaction&, model::RegistrationRecord&) override;
  std::vector<model::RegistrationRecord> ListRegistrations(Transaction&) override;

  void Close() override;

private:
  friend class MemoryTransaction;

  struct State {
    // ordered by id
    std::map<int64_t, model::RegistrationRecord> registrations;
    std::set<std::pair<std::string, std::string>> address_pairs;
    int64_t next_id = 1;
  };

  std::mutex mutex_;
  State committed_;
  bool closed_ = false;
};

}
