#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/reward_settlement.hpp"
#include "internal/util/errors.hpp"
#include "ledger_fixture.hpp"

namespace {

using scavenger::ledger::v1::Location;
using scavenger::ledger::v1::PAYEE_KIND_COLLECTOR;
using scavenger::ledger::v1::PAYEE_KIND_FINAL_HOLDER;
using scavenger::ledger::v1::PAYEE_KIND_SUBMITTER;
using scavenger::ledger::v1::WASTE_CATEGORY_GLASS;
using scavenger::ledger::v1::WASTE_CATEGORY_PLASTIC;
using scavenger::testing::FlakyValueTransfer;
using scavenger::testing::LedgerFixture;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

// alice -> bob -> mill, 5 kg of plastic; returns the waste id.
uint64_t CollectedPlastic(LedgerFixture& fx, uint64_t weight_grams = 5000) {
  const auto id = fx.ledger.SubmitWaste(WASTE_CATEGORY_PLASTIC, weight_grams, "alice", Location()).id();
  fx.ledger.TransferWaste(id, "alice", "bob", "");
  fx.ledger.TransferWaste(id, "bob", "mill", "");
  return id;
}

void TestSettlementSplitsAlongChain() {
  LedgerFixture fx;
  const auto    waste     = CollectedPlastic(fx);
  const auto    incentive = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, 100, 10000).id();

  const auto receipt = fx.ledger.SettleRewards(waste, incentive, "mill");
  assert(receipt.waste_id() == waste);
  assert(receipt.incentive_id() == incentive);
  assert(receipt.total_reward() == 500);
  assert(receipt.remaining_budget() == 9500);
  assert(receipt.incentive_active());

  assert(receipt.payments_size() == 3);
  assert(receipt.payments(0).kind() == PAYEE_KIND_COLLECTOR);
  assert(receipt.payments(0).payee() == "bob");
  assert(receipt.payments(0).amount() == 50);
  assert(receipt.payments(1).kind() == PAYEE_KIND_SUBMITTER);
  assert(receipt.payments(1).payee() == "alice");
  assert(receipt.payments(1).amount() == 100);
  assert(receipt.payments(2).kind() == PAYEE_KIND_FINAL_HOLDER);
  assert(receipt.payments(2).payee() == "mill");
  assert(receipt.payments(2).amount() == 350);

  assert(fx.ledger.GetEarnings("bob") == 50);
  assert(fx.ledger.GetEarnings("alice") == 100);
  assert(fx.ledger.GetEarnings("mill") == 350);
  assert(fx.ledger.GetEarnings("carl") == 0);

  assert(fx.journal->BalanceOf("bob") == 50);
  assert(fx.journal->BalanceOf("alice") == 100);
  assert(fx.journal->Journal().size() == 3);

  assert(fx.ledger.GetIncentiveById(incentive)->remaining_budget() == 9500);

  const auto stats = fx.ledger.GetSupplyChainStats();
  assert(stats.total_wastes() == 1);
  assert(stats.total_active_weight_grams() == 5000);
  assert(stats.total_tokens_distributed() == 500);

  // settlement does not mark the unit; a second pass pays again
  fx.ledger.SettleRewards(waste, incentive, "mill");
  assert(fx.ledger.GetEarnings("alice") == 200);
  assert(fx.ledger.GetSupplyChainStats().total_tokens_distributed() == 1000);
}

void TestRejectedSettlementsChangeNothing() {
  LedgerFixture fx;
  const auto    waste     = CollectedPlastic(fx);
  const auto    incentive = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, 100, 400).id();
  const auto    glass     = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_GLASS, 1, 10000).id();

  assert(Throws<scavenger::util::InsufficientBudget>([&] { fx.ledger.SettleRewards(waste, incentive, "mill"); }));
  assert(Throws<scavenger::util::Unauthorized>([&] { fx.ledger.SettleRewards(waste, incentive, "smelter"); }));
  assert(Throws<scavenger::util::InvalidState>([&] { fx.ledger.SettleRewards(waste, glass, "mill"); }));
  assert(Throws<scavenger::util::NotFound>([&] { fx.ledger.SettleRewards(waste, 42, "mill"); }));
  assert(Throws<scavenger::util::NotFound>([&] { fx.ledger.SettleRewards(42, incentive, "mill"); }));

  fx.ledger.SetIncentiveActive(glass, "mill", false);
  assert(Throws<scavenger::util::InvalidState>([&] { fx.ledger.SettleRewards(waste, glass, "mill"); }));

  assert(fx.ledger.GetIncentiveById(incentive)->remaining_budget() == 400);
  assert(fx.ledger.GetEarnings("alice") == 0);
  assert(fx.ledger.GetEarnings("bob") == 0);
  assert(fx.journal->Journal().empty());
  assert(fx.ledger.GetSupplyChainStats().total_tokens_distributed() == 0);
}

void TestDeactivatedWasteCannotSettle() {
  LedgerFixture fx;
  const auto    waste     = CollectedPlastic(fx);
  const auto    incentive = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, 100, 10000).id();
  fx.ledger.DeactivateWaste(waste, "root");

  assert(Throws<scavenger::util::InvalidState>([&] { fx.ledger.SettleRewards(waste, incentive, "mill"); }));
  assert(fx.ledger.GetSupplyChainStats().total_active_weight_grams() == 0);
  assert(fx.ledger.GetSupplyChainStats().total_wastes() == 1);
}

void TestSubKilogramUnitsEarnNothing() {
  LedgerFixture fx;
  const auto    waste     = CollectedPlastic(fx, 999);
  const auto    incentive = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, 100, 10000).id();

  const auto receipt = fx.ledger.SettleRewards(waste, incentive, "mill");
  assert(receipt.total_reward() == 0);
  assert(receipt.remaining_budget() == 10000);
  assert(receipt.payments_size() == 3);
  for (const auto& payment : receipt.payments()) {
    assert(payment.amount() == 0);
  }
  assert(fx.journal->Journal().empty());
  assert(fx.ledger.GetEarnings("mill") == 0);
}

void TestExhaustingBudgetClosesProgram() {
  LedgerFixture fx;
  const auto    waste     = CollectedPlastic(fx);
  const auto    incentive = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, 100, 500).id();

  const auto receipt = fx.ledger.SettleRewards(waste, incentive, "mill");
  assert(receipt.remaining_budget() == 0);
  assert(!receipt.incentive_active());
  assert(!fx.ledger.GetIncentiveById(incentive)->active());
  assert(Throws<scavenger::util::InvalidState>([&] { fx.ledger.SettleRewards(waste, incentive, "mill"); }));
}

void TestEveryCollectorHopIsPaid() {
  LedgerFixture fx;
  const auto    waste = fx.ledger.SubmitWaste(WASTE_CATEGORY_PLASTIC, 10000, "alice", Location()).id();
  fx.ledger.TransferWaste(waste, "alice", "bob", "");
  fx.ledger.TransferWaste(waste, "bob", "mill", "");
  const auto incentive = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, 100, 10000).id();

  scavenger::db::model::WasteRecord unit;
  unit.id            = waste;
  unit.category      = WASTE_CATEGORY_PLASTIC;
  unit.weight_grams  = 10000;
  unit.submitter     = "alice";
  unit.current_owner = "mill";

  scavenger::db::model::IncentiveRecord program;
  program.id               = incentive;
  program.issuer           = "mill";
  program.category         = WASTE_CATEGORY_PLASTIC;
  program.reward_rate      = 100;
  program.total_budget     = 10000;
  program.remaining_budget = 10000;
  program.active           = true;

  std::vector<scavenger::db::model::TransferRecord> history(3);
  history[0].to = "bob";
  history[1].to = "carl";
  history[2].to = "mill";

  const auto is_collector = [](const std::string& participant) { return participant == "bob" || participant == "carl"; };

  const auto plan = scavenger::core::PlanSettlement(unit, program, history, {10, 20}, is_collector);
  assert(plan.total_reward == 1000);
  assert(plan.payments.size() == 4);
  assert(plan.payments[0].payee == "bob");
  assert(plan.payments[0].amount == 100);
  assert(plan.payments[1].payee == "carl");
  assert(plan.payments[1].amount == 100);
  assert(plan.payments[2].kind == PAYEE_KIND_SUBMITTER);
  assert(plan.payments[2].amount == 200);
  assert(plan.payments[3].kind == PAYEE_KIND_FINAL_HOLDER);
  assert(plan.payments[3].amount == 600);

  // two 60% collector shares cannot both be paid
  assert(Throws<scavenger::util::Overflow>([&] { scavenger::core::PlanSettlement(unit, program, history, {60, 0}, is_collector); }));
}

void TestPaymentFailureRollsBackBook() {
  auto          payments = std::make_shared<FlakyValueTransfer>(2);
  LedgerFixture fx({10, 20}, payments);
  const auto    waste     = CollectedPlastic(fx);
  const auto    incentive = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, 100, 10000).id();

  assert(Throws<std::runtime_error>([&] { fx.ledger.SettleRewards(waste, incentive, "mill"); }));
  assert(fx.ledger.GetIncentiveById(incentive)->remaining_budget() == 10000);
  assert(fx.ledger.GetEarnings("bob") == 0);
  assert(fx.ledger.GetEarnings("alice") == 0);
  assert(fx.ledger.GetSupplyChainStats().total_tokens_distributed() == 0);
  // the batch check passed; the first payment left the process before the rail failed
  assert(payments->journal.Journal().size() == 1);

  const auto receipt = fx.ledger.SettleRewards(waste, incentive, "mill");
  assert(receipt.remaining_budget() == 9500);
  assert(fx.ledger.GetEarnings("bob") == 50);
}

void TestOverflowingSettlementChangesNothing() {
  constexpr uint64_t kHalfRange = uint64_t{1} << 63;
  constexpr uint64_t kRich      = kHalfRange + (kHalfRange >> 1);

  LedgerFixture fx({1, 1});
  const auto    heavy = CollectedPlastic(fx, 3000);
  const auto    light = CollectedPlastic(fx, 1000);

  // rate * kg does not fit in 64 bits
  const auto steep = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, kHalfRange, kHalfRange).id();
  assert(Throws<scavenger::util::Overflow>([&] { fx.ledger.SettleRewards(heavy, steep, "mill"); }));

  // fits the budget, but the holder share is beyond what a balance can carry;
  // the collector and submitter shares alone would have been payable
  const auto rich = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, kRich, kRich).id();
  assert(Throws<scavenger::util::Overflow>([&] { fx.ledger.SettleRewards(light, rich, "mill"); }));

  assert(fx.journal->Journal().empty());
  assert(fx.journal->BalanceOf("bob") == 0);
  assert(fx.journal->BalanceOf("mill") == 0);
  assert(fx.ledger.GetIncentiveById(steep)->remaining_budget() == kHalfRange);
  assert(fx.ledger.GetIncentiveById(rich)->remaining_budget() == kRich);
  assert(fx.ledger.GetIncentiveById(rich)->active());
  assert(fx.ledger.GetEarnings("bob") == 0);
  assert(fx.ledger.GetEarnings("alice") == 0);
  assert(fx.ledger.GetEarnings("mill") == 0);
  assert(fx.ledger.GetSupplyChainStats().total_tokens_distributed() == 0);
  assert(fx.events->topics.back() != "rewards.settled");
}

void TestJournalCheckMovesNothing() {
  scavenger::payments::JournalValueTransfer journal;
  const auto max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

  journal.Check({{"mill", "bob", 40}, {"mill", "mill", 1000}});
  assert(journal.Journal().empty());

  // each payment fits alone; together they overflow bob's balance
  assert(Throws<scavenger::util::Overflow>([&] { journal.Check({{"mill", "bob", max}, {"smelter", "bob", 1}}); }));
  assert(Throws<scavenger::util::Overflow>([&] { journal.Check({{"mill", "bob", max + 1}}); }));
  assert(Throws<scavenger::util::InvalidInput>([&] { journal.Check({{"mill", "bob", 0}}); }));
  assert(journal.BalanceOf("bob") == 0);
  assert(journal.Journal().empty());

  journal.Pay("mill", "bob", max);
  assert(Throws<scavenger::util::Overflow>([&] { journal.Check({{"smelter", "bob", 1}}); }));
  assert(journal.Journal().size() == 1);
}

void TestParticipantStatsIncludeEarnings() {
  LedgerFixture fx;
  const auto    waste     = CollectedPlastic(fx);
  const auto    incentive = fx.ledger.CreateIncentive("mill", WASTE_CATEGORY_PLASTIC, 100, 10000).id();
  fx.ledger.SettleRewards(waste, incentive, "mill");

  const auto alice = fx.ledger.GetParticipantStats("alice");
  assert(alice.has_value());
  assert(alice->total_submissions() == 1);
  assert(alice->total_weight_grams() == 5000);
  assert(alice->total_earned() == 100);

  // collectors earn without submitting
  const auto bob = fx.ledger.GetParticipantStats("bob");
  assert(bob.has_value());
  assert(bob->total_submissions() == 0);
  assert(bob->by_category_size() == 0);
  assert(bob->total_earned() == 50);

  assert(!fx.ledger.GetParticipantStats("carl").has_value());
}

void TestStatsAcrossUnits() {
  LedgerFixture fx;
  const auto    first = fx.ledger.SubmitWaste(WASTE_CATEGORY_PLASTIC, 1500, "alice", Location()).id();
  fx.ledger.SubmitWaste(WASTE_CATEGORY_GLASS, 2500, "dave", Location());
  fx.ledger.TransferBulkWaste(WASTE_CATEGORY_GLASS, "carl", "smelter", Location(), "");

  auto stats = fx.ledger.GetSupplyChainStats();
  assert(stats.total_wastes() == 3);
  assert(stats.total_active_weight_grams() == 4000);

  fx.ledger.DeactivateWaste(first, "root");
  stats = fx.ledger.GetSupplyChainStats();
  assert(stats.total_wastes() == 3);
  assert(stats.total_active_weight_grams() == 2500);
  assert(stats.total_tokens_distributed() == 0);
}

} // namespace

int main() {
  TestSettlementSplitsAlongChain();
  TestRejectedSettlementsChangeNothing();
  TestDeactivatedWasteCannotSettle();
  TestSubKilogramUnitsEarnNothing();
  TestExhaustingBudgetClosesProgram();
  TestEveryCollectorHopIsPaid();
  TestPaymentFailureRollsBackBook();
  TestOverflowingSettlementChangesNothing();
  TestJournalCheckMovesNothing();
  TestParticipantStatsIncludeEarnings();
  TestStatsAcrossUnits();

  std::cout << "scavenger_unit_reward_settlement: pass\n";
  return 0;
}
