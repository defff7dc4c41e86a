#pragma once

#include <cstdint>
#include <string>

namespace registry::db::model {

/*
  Persistent registration row.

  IMPORTANT:
  - (eth_address, rgb_address) is unique across the table.
  - id, created_at and updated_at are assigned by the store on insert.
  - Rows are immutable once written.
*/

struct RegistrationRecord {
  int64_t id = 0;

  std::string eth_address;
  std::string rgb_address;
  std::string signature;
  std::string message;

  // ISO-8601 UTC, millisecond precision
  std::string created_at;
  std::string updated_at;
};

} // namespace registry::db::model
