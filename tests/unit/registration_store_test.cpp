#include <cassert>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/registration_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using registry::core::InsertResult;
using registry::core::RegistrationStore;

const std::string kEthA = "0x52908400098527886E0F7030069857D2E4169EE7";
const std::string kEthB = "0x8617E340B3D01FA5F11F306F4090FD50E238070D";
const std::string kRgbA = "bc1p5d7rjq7g6rdk2yhzks9smlaqtedr4dekq08ge8ztwac72sfr9rusxg3297";
const std::string kRgbB = "bc1pqqqsyqcyq5rqwzqfpg9scrgwpugpzysnzs23v9ccrydpk8qarc0s7xmq8h";
const std::string kSig  = std::string(130, 'c');

std::filesystem::path FreshDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "registry_store_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

struct Backend {
  std::string                                  name;
  std::function<std::shared_ptr<registry::db::Repository>()> make;
};

std::vector<Backend> Backends(const std::string& test_name) {
  return {
      {"memory", [] { return std::make_shared<registry::db::memory::MemoryRepository>(); }},
      {"sqlite",
       [test_name] {
         auto db = std::make_shared<registry::db::sqlite::SqliteDB>(FreshDbPath(test_name).string());
         return std::make_shared<registry::db::sqlite::SqliteRepository>(std::move(db));
       }},
  };
}

void TestInsertAssignsIncreasingIds(const Backend& backend) {
  RegistrationStore store(backend.make());

  const auto first  = store.Insert(kEthA, kRgbA, kSig, "first");
  const auto second = store.Insert(kEthB, kRgbA, kSig, "second");
  assert(first.outcome == InsertResult::Outcome::kCreated);
  assert(second.outcome == InsertResult::Outcome::kCreated);
  assert(second.id > first.id);

  const auto rows = store.ListAll();
  assert(rows.size() == 2);
  assert(rows[0].id == first.id);
  assert(rows[0].eth_address == kEthA);
  assert(rows[0].message == "first");
  assert(rows[0].signature == kSig);
  assert(rows[0].created_at == rows[0].updated_at);
  assert(rows[0].created_at.size() == 24 && rows[0].created_at.back() == 'Z');
  assert(rows[1].id == second.id);
}

void TestDuplicatePairIsConflict(const Backend& backend) {
  RegistrationStore store(backend.make());

  assert(store.Insert(kEthA, kRgbA, kSig, "original").outcome == InsertResult::Outcome::kCreated);

  const auto duplicate = store.Insert(kEthA, kRgbA, std::string(200, 'd'), "replacement");
  assert(duplicate.outcome == InsertResult::Outcome::kConflict);

  // same eth with another rgb, and another eth with the same rgb, are distinct pairs
  assert(store.Insert(kEthA, kRgbB, kSig, "other rgb").outcome == InsertResult::Outcome::kCreated);
  assert(store.Insert(kEthB, kRgbA, kSig, "other eth").outcome == InsertResult::Outcome::kCreated);

  const auto rows = store.ListAll();
  assert(rows.size() == 3);
  assert(rows[0].message == "original");
}

void TestAddressesAreStoredVerbatim(const Backend& backend) {
  RegistrationStore store(backend.make());

  std::string lower = kEthA;
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  lower[1] = 'x';

  assert(store.Insert(kEthA, kRgbA, kSig, "mixed").outcome == InsertResult::Outcome::kCreated);
  assert(store.Insert(lower, kRgbA, kSig, "lower").outcome == InsertResult::Outcome::kCreated);

  const auto rows = store.ListAll();
  assert(rows.size() == 2);
  assert(rows[0].eth_address == kEthA);
  assert(rows[1].eth_address == lower);
}

void TestConcurrentDuplicatesCreateExactlyOne(const Backend& backend) {
  RegistrationStore store(backend.make());

  constexpr int    kThreads = 8;
  std::atomic<int> created{0};
  std::atomic<int> conflicts{0};
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      const auto result = store.Insert(kEthA, kRgbA, kSig, "racer " + std::to_string(i));
      switch (result.outcome) {
        case InsertResult::Outcome::kCreated:
          ++created;
          break;
        case InsertResult::Outcome::kConflict:
          ++conflicts;
          break;
        case InsertResult::Outcome::kStoreFailure:
          ++failures;
          break;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(created == 1);
  assert(conflicts == kThreads - 1);
  assert(failures == 0);
  assert(store.ListAll().size() == 1);
}

void TestCloseIsIdempotentAndFinal(const Backend& backend) {
  RegistrationStore store(backend.make());
  assert(store.Insert(kEthA, kRgbA, kSig, "before close").outcome == InsertResult::Outcome::kCreated);

  store.Close();
  store.Close();
  assert(store.IsClosed());

  const auto after = store.Insert(kEthB, kRgbB, kSig, "after close");
  assert(after.outcome == InsertResult::Outcome::kStoreFailure);
  assert(!after.cause.empty());

  bool threw = false;
  try {
    (void)store.ListAll();
  } catch (const registry::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw && "ListAll on a closed store must fail");
}

void TestNullRepositoryIsRejected() {
  bool threw = false;
  try {
    RegistrationStore store(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  for (const auto& backend : Backends("insert_ids")) TestInsertAssignsIncreasingIds(backend);
  for (const auto& backend : Backends("duplicate")) TestDuplicatePairIsConflict(backend);
  for (const auto& backend : Backends("verbatim")) TestAddressesAreStoredVerbatim(backend);
  for (const auto& backend : Backends("concurrent")) TestConcurrentDuplicatesCreateExactlyOne(backend);
  for (const auto& backend : Backends("close")) TestCloseIsIdempotentAndFinal(backend);
  TestNullRepositoryIsRejected();

  std::cout << "registry_unit_registration_store: pass\n";
  return 0;
}
