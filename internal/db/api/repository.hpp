#pragma once

#include <memory>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/registration_record.hpp"

namespace registry::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - The (eth_address, rgb_address) pair is unique; a duplicate insert
    returns ErrorCode::AlreadyExists and leaves the table untouched
  - Ids are assigned by the backend, strictly increasing, never reused

  The DB is the source of truth for registrations.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // Creates tables and indexes when absent. Idempotent.
  virtual void EnsureSchema() = 0;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // On success fills id, created_at and updated_at of the record.
  virtual Result InsertRegistration(Transaction&, model::RegistrationRecord&) = 0;

  // Ascending id order. Throws std::runtime_error on backend failure.
  virtual std::vector<model::RegistrationRecord> ListRegistrations(Transaction&) = 0;

  // Flushes pending writes to durable storage and releases the backend.
  virtual void Close() = 0;
};

} // namespace registry::db
