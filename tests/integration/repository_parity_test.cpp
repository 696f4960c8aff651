#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/earnings_record.hpp"
#include "internal/db/model/incentive_record.hpp"
#include "internal/db/model/participant_activity_record.hpp"
#include "internal/db/model/transfer_record.hpp"
#include "internal/db/model/waste_record.hpp"

#if SCAVENGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using scavenger::db::ErrorCode;
using scavenger::db::Repository;
using scavenger::db::TxState;
using scavenger::db::memory::MemoryRepository;
using scavenger::db::model::EarningsRecord;
using scavenger::db::model::IncentiveRecord;
using scavenger::db::model::ParticipantActivityRecord;
using scavenger::db::model::TransferRecord;
using scavenger::db::model::WasteRecord;
using scavenger::ledger::v1::WASTE_CATEGORY_GLASS;
using scavenger::ledger::v1::WASTE_CATEGORY_METAL;
using scavenger::ledger::v1::WASTE_CATEGORY_PAPER;
using scavenger::ledger::v1::WASTE_CATEGORY_PLASTIC;
using scavenger::ledger::v1::WASTE_STATUS_PENDING;
using scavenger::ledger::v1::WASTE_STATUS_PROCESSING;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

WasteRecord MakeWaste(uint64_t id, const std::string& owner) {
  WasteRecord waste;
  waste.id            = id;
  waste.category      = WASTE_CATEGORY_PLASTIC;
  waste.weight_grams  = 5000;
  waste.submitter     = owner;
  waste.current_owner = owner;
  waste.confirmer     = owner;
  waste.latitude      = -6208800;
  waste.longitude     = 106845600;
  waste.description   = "depot 7";
  waste.created_at_ms = NowMs();
  return waste;
}

void VerifyCountersStartAtZero(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.GetCounter(*tx, "waste") == 0);
  assert(repo.SetCounter(*tx, "waste", 1));
  assert(repo.GetCounter(*tx, "waste") == 1);
  assert(repo.SetCounter(*tx, "waste", 2));
  assert(repo.GetCounter(*tx, "waste") == 2);
  assert(repo.GetCounter(*tx, "incentive") == 0);
  tx->Commit();
}

void VerifyWasteReadWrite(Repository& repo) {
  auto tx = repo.Begin();

  auto waste = MakeWaste(1, "alice");
  assert(repo.InsertWaste(*tx, waste));

  auto duplicate = repo.InsertWaste(*tx, waste);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto read = repo.GetWaste(*tx, 1);
  assert(read.has_value());
  assert(read->category == WASTE_CATEGORY_PLASTIC);
  assert(read->weight_grams == 5000);
  assert(read->status == WASTE_STATUS_PENDING);
  assert(read->is_active);
  assert(!read->is_confirmed);
  assert(read->latitude == -6208800);
  assert(read->longitude == 106845600);
  assert(read->description == "depot 7");

  read->status        = WASTE_STATUS_PROCESSING;
  read->current_owner = "bob";
  read->is_confirmed  = true;
  read->confirmer     = "carol";
  assert(repo.UpdateWaste(*tx, *read));

  auto updated = repo.GetWaste(*tx, 1);
  assert(updated.has_value());
  assert(updated->status == WASTE_STATUS_PROCESSING);
  assert(updated->current_owner == "bob");
  assert(updated->submitter == "alice");
  assert(updated->confirmer == "carol");

  auto missing = MakeWaste(99, "nobody");
  auto result  = repo.UpdateWaste(*tx, missing);
  assert(!result);
  assert(result.code == ErrorCode::NotFound);
  assert(!repo.GetWaste(*tx, 99).has_value());

  assert(repo.InsertWaste(*tx, MakeWaste(2, "alice")));
  const auto all = repo.ListWastes(*tx);
  assert(all.size() == 2);
  assert(all[0].id == 1);
  assert(all[1].id == 2);

  tx->Commit();
}

void VerifyTransfersKeepAppendOrder(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertWaste(*tx, MakeWaste(10, "alice")));

  assert(repo.AppendTransfer(*tx, TransferRecord{.id = 1, .waste_id = 10, .from = "alice", .to = "bob", .timestamp_ms = 100, .note = "pickup"}));
  assert(repo.AppendTransfer(*tx, TransferRecord{.id = 2, .waste_id = 10, .from = "bob", .to = "mill", .timestamp_ms = 100, .note = ""}));

  const auto history = repo.GetTransfers(*tx, 10);
  assert(history.size() == 2);
  assert(history[0].to == "bob");
  assert(history[0].note == "pickup");
  assert(history[1].from == "bob");
  assert(history[1].to == "mill");

  assert(repo.GetTransfers(*tx, 11).empty());

  auto orphan = repo.AppendTransfer(*tx, TransferRecord{.id = 3, .waste_id = 404, .from = "x", .to = "y", .timestamp_ms = 1, .note = ""});
  assert(!orphan);
  assert(orphan.code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyParticipantLinksAreIdempotent(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertWaste(*tx, MakeWaste(20, "dana")));
  assert(repo.InsertWaste(*tx, MakeWaste(21, "dana")));

  assert(repo.LinkParticipantWaste(*tx, "dana", 21));
  assert(repo.LinkParticipantWaste(*tx, "dana", 20));
  assert(repo.LinkParticipantWaste(*tx, "dana", 21));

  const auto ids = repo.GetParticipantWastes(*tx, "dana");
  assert(ids.size() == 2);
  assert(ids[0] == 21);
  assert(ids[1] == 20);
  assert(repo.GetParticipantWastes(*tx, "stranger").empty());

  tx->Commit();
}

void VerifyIncentiveIndices(Repository& repo) {
  auto tx = repo.Begin();

  IncentiveRecord first{.id = 1, .issuer = "mill", .category = WASTE_CATEGORY_PLASTIC, .reward_rate = 100, .total_budget = 10000,
                        .remaining_budget = 10000, .active = true, .created_at_ms = NowMs()};
  IncentiveRecord second{.id = 2, .issuer = "smelter", .category = WASTE_CATEGORY_METAL, .reward_rate = 50, .total_budget = 500,
                         .remaining_budget = 500, .active = true, .created_at_ms = NowMs()};
  IncentiveRecord third{.id = 3, .issuer = "mill", .category = WASTE_CATEGORY_PLASTIC, .reward_rate = 70, .total_budget = 700,
                        .remaining_budget = 700, .active = true, .created_at_ms = NowMs()};
  assert(repo.InsertIncentive(*tx, first));
  assert(repo.InsertIncentive(*tx, second));
  assert(repo.InsertIncentive(*tx, third));

  const auto by_issuer = repo.ListIncentivesByIssuer(*tx, "mill");
  assert((by_issuer == std::vector<uint64_t>{1, 3}));
  const auto by_category = repo.ListIncentivesByCategory(*tx, WASTE_CATEGORY_PLASTIC);
  assert((by_category == std::vector<uint64_t>{1, 3}));
  assert(repo.ListIncentivesByCategory(*tx, WASTE_CATEGORY_GLASS).empty());

  first.remaining_budget = 9500;
  first.reward_rate      = 120;
  assert(repo.UpdateIncentive(*tx, first));
  auto read = repo.GetIncentive(*tx, 1);
  assert(read.has_value());
  assert(read->remaining_budget == 9500);
  assert(read->reward_rate == 120);

  auto moved     = first;
  moved.issuer   = "someone-else";
  auto rejected  = repo.UpdateIncentive(*tx, moved);
  assert(!rejected);
  assert(rejected.code == ErrorCode::ConstraintViolation);

  auto unknown = first;
  unknown.id   = 77;
  auto missing = repo.UpdateIncentive(*tx, unknown);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyEarningsUpsert(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetEarnings(*tx, "erin").has_value());
  assert(repo.UpsertEarnings(*tx, EarningsRecord{.participant = "erin", .total_earned = 40, .updated_at_ms = 1}));
  assert(repo.UpsertEarnings(*tx, EarningsRecord{.participant = "erin", .total_earned = 90, .updated_at_ms = 2}));
  auto read = repo.GetEarnings(*tx, "erin");
  assert(read.has_value());
  assert(read->total_earned == 90);
  assert(read->updated_at_ms == 2);
  tx->Commit();
}

// Values above INT64_MAX must round-trip and compare as unsigned.
void VerifyFullRangeValues(Repository& repo) {
  constexpr uint64_t kHalfRange = uint64_t{1} << 63;
  constexpr uint64_t kMax       = std::numeric_limits<uint64_t>::max();

  auto tx = repo.Begin();

  IncentiveRecord program{.id = 40, .issuer = "mill", .category = WASTE_CATEGORY_PLASTIC, .reward_rate = kHalfRange + 7,
                          .total_budget = kHalfRange + 1000, .remaining_budget = kHalfRange + 1000, .active = true,
                          .created_at_ms = NowMs()};
  assert(repo.InsertIncentive(*tx, program));

  // debited from above 2^63 to below it
  program.remaining_budget = kHalfRange - 500;
  assert(repo.UpdateIncentive(*tx, program));
  auto read = repo.GetIncentive(*tx, 40);
  assert(read.has_value());
  assert(read->reward_rate == kHalfRange + 7);
  assert(read->total_budget == kHalfRange + 1000);
  assert(read->remaining_budget == kHalfRange - 500);

  program.remaining_budget = program.total_budget + 1;
  auto over = repo.UpdateIncentive(*tx, program);
  assert(!over);
  assert(over.code == ErrorCode::ConstraintViolation);
  assert(repo.GetIncentive(*tx, 40)->remaining_budget == kHalfRange - 500);

  // remaining below 2^63 but total above it is the bound signed SQL gets wrong
  IncentiveRecord inverted{.id = 41, .issuer = "mill", .category = WASTE_CATEGORY_PLASTIC, .reward_rate = 1, .total_budget = 10,
                           .remaining_budget = kHalfRange, .active = true, .created_at_ms = NowMs()};
  auto rejected = repo.InsertIncentive(*tx, inverted);
  assert(!rejected);
  assert(rejected.code == ErrorCode::ConstraintViolation);
  assert(!repo.GetIncentive(*tx, 41).has_value());

  auto heavy         = MakeWaste(40, "ivan");
  heavy.weight_grams = kMax;
  assert(repo.InsertWaste(*tx, heavy));
  assert(repo.GetWaste(*tx, 40)->weight_grams == kMax);

  assert(repo.SetCounter(*tx, "tokens_distributed", kMax - 1));
  assert(repo.GetCounter(*tx, "tokens_distributed") == kMax - 1);
  assert(repo.UpsertEarnings(*tx, EarningsRecord{.participant = "ivan", .total_earned = kHalfRange + 3, .updated_at_ms = 1}));
  assert(repo.GetEarnings(*tx, "ivan")->total_earned == kHalfRange + 3);

  tx->Commit();
}

void VerifyParticipantActivity(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetParticipantActivity(*tx, "jane").has_value());

  ParticipantActivityRecord activity;
  activity.participant        = "jane";
  activity.total_submissions  = 3;
  activity.total_weight_grams = (uint64_t{1} << 63) + 12;
  activity.submissions_by_category[WASTE_CATEGORY_GLASS]   = 1;
  activity.submissions_by_category[WASTE_CATEGORY_PLASTIC] = 2;
  activity.updated_at_ms = 5;
  assert(repo.UpsertParticipantActivity(*tx, activity));

  auto read = repo.GetParticipantActivity(*tx, "jane");
  assert(read.has_value());
  assert(read->total_submissions == 3);
  assert(read->total_weight_grams == (uint64_t{1} << 63) + 12);
  assert(read->submissions_by_category.size() == 2);
  assert(read->submissions_by_category.at(WASTE_CATEGORY_PLASTIC) == 2);

  // a later upsert replaces the per-category counts
  activity.total_submissions = 4;
  activity.submissions_by_category.clear();
  activity.submissions_by_category[WASTE_CATEGORY_PAPER] = 4;
  activity.updated_at_ms = 6;
  assert(repo.UpsertParticipantActivity(*tx, activity));

  read = repo.GetParticipantActivity(*tx, "jane");
  assert(read->total_submissions == 4);
  assert(read->updated_at_ms == 6);
  assert(read->submissions_by_category.size() == 1);
  assert(read->submissions_by_category.at(WASTE_CATEGORY_PAPER) == 4);
  assert(!repo.GetParticipantActivity(*tx, "kim").has_value());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertWaste(*tx, MakeWaste(500, "frank")));
    assert(repo.SetCounter(*tx, "rollback", 5));
    assert(tx->IsOpen());
    tx->Rollback();
    assert(tx->State() == TxState::kRolledBack);
  }
  {
    // destroyed without commit
    auto tx = repo.Begin();
    assert(repo.InsertWaste(*tx, MakeWaste(501, "frank")));
  }
  auto check_tx = repo.Begin();
  assert(!repo.GetWaste(*check_tx, 500).has_value());
  assert(!repo.GetWaste(*check_tx, 501).has_value());
  assert(repo.GetCounter(*check_tx, "rollback") == 0);
  check_tx->Commit();
}

void VerifyConcurrentTransactions(Repository& repo, bool supports_parallel_transactions) {
  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  // snapshot transactions: the second writer loses
  auto tx2 = repo.Begin();
  assert(repo.SetCounter(*tx1, "race", 1));
  assert(repo.SetCounter(*tx2, "race", 2));
  tx1->Commit();
  assert(tx1->State() == TxState::kCommitted);

  bool threw = false;
  try {
    tx2->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!tx2->IsOpen());

  auto verify_tx = repo.Begin();
  assert(repo.GetCounter(*verify_tx, "race") == 1);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->SetCounter(*tx, "waste", 900));
    assert(repo->InsertWaste(*tx, MakeWaste(900, "gina")));
    assert(repo->AppendTransfer(*tx, TransferRecord{.id = 900, .waste_id = 900, .from = "gina", .to = "hub", .timestamp_ms = 5, .note = ""}));
    assert(repo->LinkParticipantWaste(*tx, "gina", 900));

    ParticipantActivityRecord activity{.participant = "gina", .total_submissions = 1, .total_weight_grams = 5000};
    activity.submissions_by_category[WASTE_CATEGORY_PLASTIC] = 1;
    assert(repo->UpsertParticipantActivity(*tx, activity));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetCounter(*tx, "waste") == 900);
  auto waste = repo->GetWaste(*tx, 900);
  assert(waste.has_value());
  assert(waste->submitter == "gina");
  assert(repo->GetTransfers(*tx, 900).size() == 1);
  assert(repo->GetParticipantWastes(*tx, "gina").size() == 1);
  auto activity = repo->GetParticipantActivity(*tx, "gina");
  assert(activity.has_value());
  assert(activity->submissions_by_category.at(WASTE_CATEGORY_PLASTIC) == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if SCAVENGER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path   = (std::filesystem::temp_directory_path() / ("scavenger_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();
  auto make_repo = [db_path]() {
    auto db = std::make_shared<scavenger::db::sqlite::SqliteDB>(db_path);
    scavenger::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<scavenger::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyCountersStartAtZero(*repo);
    VerifyWasteReadWrite(*repo);
    VerifyTransfersKeepAppendOrder(*repo);
    VerifyParticipantLinksAreIdempotent(*repo);
    VerifyIncentiveIndices(*repo);
    VerifyEarningsUpsert(*repo);
    VerifyFullRangeValues(*repo);
    VerifyParticipantActivity(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyConcurrentTransactions(*repo, backend.supports_parallel_transactions);
  }

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SCAVENGER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "scavenger_integration_repository_parity: pass\n";
  return 0;
}
