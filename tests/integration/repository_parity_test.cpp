#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/registration_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/registration_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using registry::db::ErrorCode;
using registry::db::Repository;
using registry::db::memory::MemoryRepository;
using registry::db::model::RegistrationRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RegistrationRecord Candidate(const std::string& eth, const std::string& rgb, const std::string& message) {
  return RegistrationRecord{.eth_address = eth, .rgb_address = rgb, .signature = std::string(128, 's'), .message = message};
}

std::string Eth(int n) {
  std::string hex = std::to_string(n);
  return "0x" + std::string(40 - hex.size(), '0') + hex;
}

void VerifyInsertAndList(Repository& repo) {
  auto tx = repo.Begin();

  auto first = Candidate(Eth(1), "bc1pfirst", "one");
  assert(repo.InsertRegistration(*tx, first));
  assert(first.id > 0);
  assert(!first.created_at.empty());
  assert(first.created_at == first.updated_at);

  auto second = Candidate(Eth(2), "bc1psecond", "two");
  assert(repo.InsertRegistration(*tx, second));
  assert(second.id > first.id);

  // visible inside the same transaction before commit
  auto rows = repo.ListRegistrations(*tx);
  assert(rows.size() == 2);
  tx->Commit();

  auto read_tx = repo.Begin();
  rows         = repo.ListRegistrations(*read_tx);
  read_tx->Commit();

  assert(rows.size() == 2);
  assert(rows[0].id == first.id);
  assert(rows[0].eth_address == Eth(1));
  assert(rows[0].rgb_address == "bc1pfirst");
  assert(rows[0].message == "one");
  assert(rows[0].created_at == first.created_at);
  assert(rows[1].id == second.id);
}

void VerifyDuplicateLeavesTableUntouched(Repository& repo) {
  {
    auto tx       = repo.Begin();
    auto original = Candidate(Eth(10), "bc1pdup", "original");
    assert(repo.InsertRegistration(*tx, original));
    tx->Commit();
  }

  auto tx        = repo.Begin();
  auto duplicate = Candidate(Eth(10), "bc1pdup", "replacement");
  auto result    = repo.InsertRegistration(*tx, duplicate);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();

  auto read_tx = repo.Begin();
  auto rows    = repo.ListRegistrations(*read_tx);
  read_tx->Commit();

  int matches = 0;
  for (const auto& row : rows) {
    if (row.eth_address == Eth(10) && row.rgb_address == "bc1pdup") {
      ++matches;
      assert(row.message == "original");
    }
  }
  assert(matches == 1);
}

void VerifyUncommittedWorkIsDiscarded(Repository& repo) {
  std::size_t before = 0;
  {
    auto tx = repo.Begin();
    before  = repo.ListRegistrations(*tx).size();
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto record = Candidate(Eth(20), "bc1pdropped", "dropped");
    assert(repo.InsertRegistration(*tx, record));
    // destroyed without commit
  }

  {
    auto tx     = repo.Begin();
    auto record = Candidate(Eth(21), "bc1prolled", "rolled back");
    assert(repo.InsertRegistration(*tx, record));
    tx->Rollback();
    assert(tx->IsCommitted());
  }

  auto tx = repo.Begin();
  assert(repo.ListRegistrations(*tx).size() == before);
  tx->Commit();

  // the pair is free again
  auto retry = repo.Begin();
  auto again = Candidate(Eth(20), "bc1pdropped", "kept");
  assert(repo.InsertRegistration(*retry, again));
  retry->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto    repo = backend.make_repository();
  int64_t id   = 0;
  {
    auto tx     = repo->Begin();
    auto record = Candidate(Eth(30), "bc1pdurable", "survives restart");
    assert(repo->InsertRegistration(*tx, record));
    id = record.id;
    tx->Commit();
  }

  backend.restart(repo);

  {
    auto tx   = repo->Begin();
    auto rows = repo->ListRegistrations(*tx);
    tx->Commit();
    assert(rows.size() == 1);
    assert(rows[0].id == id);
    assert(rows[0].message == "survives restart");
  }

  // uniqueness is still enforced by the reopened schema, and ids keep increasing
  {
    auto tx        = repo->Begin();
    auto duplicate = Candidate(Eth(30), "bc1pdurable", "again");
    assert(repo->InsertRegistration(*tx, duplicate).code == ErrorCode::AlreadyExists);
    tx->Rollback();

    auto next_tx = repo->Begin();
    auto next    = Candidate(Eth(31), "bc1pdurable", "next");
    assert(repo->InsertRegistration(*next_tx, next));
    assert(next.id > id);
    next_tx->Commit();
  }

  repo->Close();
  backend.cleanup();
}

void VerifyStoreCloseIsDurable(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  {
    registry::core::RegistrationStore store(backend.make_repository());
    for (int i = 0; i < 5; ++i) {
      const auto result = store.Insert(Eth(100 + i), "bc1pclose", std::string(100, 'x'), "row " + std::to_string(i));
      assert(result.outcome == registry::core::InsertResult::Outcome::kCreated);
    }
    store.Close();
  }

  registry::core::RegistrationStore reopened(backend.make_repository());
  const auto                        rows = reopened.ListAll();
  assert(rows.size() == 5);
  for (std::size_t i = 1; i < rows.size(); ++i) {
    assert(rows[i].id > rows[i - 1].id);
  }
  reopened.Close();
  backend.cleanup();
}

void VerifyClosedRepositoryRejectsWork(BackendFactory& backend) {
  auto repo = backend.make_repository();
  repo->Close();
  repo->Close();

  bool threw = false;
  try {
    auto tx = repo->Begin();
    (void)tx;
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw && "Begin on a closed repository must fail");
  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory(const std::string& label) {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("registry_integration_sqlite_" + label + "_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db   = std::make_shared<registry::db::sqlite::SqliteDB>(db_path);
    auto repo = std::make_shared<registry::db::sqlite::SqliteRepository>(std::move(db));
    repo->EnsureSchema();
    return repo;
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart =
          [make_repo](std::shared_ptr<Repository>& repo) {
            repo->Close();
            repo = make_repo();
          },
      .cleanup =
          [db_path]() {
            for (const char* suffix : {"", "-wal", "-shm"}) {
              std::filesystem::remove(db_path + suffix);
            }
          },
  };
}

void RunSuite(BackendFactory backend) {
  auto repo = backend.make_repository();
  VerifyInsertAndList(*repo);
  VerifyDuplicateLeavesTableUntouched(*repo);
  VerifyUncommittedWorkIsDiscarded(*repo);
  repo->Close();
  backend.cleanup();

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunSuite(MakeMemoryFactory());
  RunSuite(MakeSqliteFactory("suite"));

  auto restart = MakeSqliteFactory("restart");
  VerifyRestartDurability(restart);

  auto store_close = MakeSqliteFactory("store_close");
  VerifyStoreCloseIsDurable(store_close);

  auto memory_closed = MakeMemoryFactory();
  VerifyClosedRepositoryRejectsWork(memory_closed);
  auto sqlite_closed = MakeSqliteFactory("closed");
  VerifyClosedRepositoryRejectsWork(sqlite_closed);

  std::cout << "registry_integration_repository_parity: pass\n";
  return 0;
}
