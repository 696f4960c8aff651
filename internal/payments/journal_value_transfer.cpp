#include "journal_value_transfer.hpp"

#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace scavenger::payments {

using scavenger::observability::StringField;
using scavenger::observability::UintField;

namespace {

using Balances = std::unordered_map<std::string, int64_t>;

// Validates one payment against `balances` and applies it there.
void Apply(Balances& balances, const std::string& from, const std::string& to, uint64_t amount) {
  if (amount == 0) {
    throw scavenger::util::InvalidInput("payment amount must be greater than zero");
  }
  if (amount > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw scavenger::util::Overflow("payment amount exceeds balance range");
  }

  const auto signed_amount = static_cast<int64_t>(amount);
  const auto sender        = balances[from];
  if (sender < std::numeric_limits<int64_t>::min() + signed_amount) {
    throw scavenger::util::Overflow("payment would overflow a balance");
  }
  balances[from] = sender - signed_amount;

  // from == to nets out once the debit above has landed
  const auto receiver = balances[to];
  if (receiver > std::numeric_limits<int64_t>::max() - signed_amount) {
    balances[from] = sender;
    throw scavenger::util::Overflow("payment would overflow a balance");
  }
  balances[to] = receiver + signed_amount;
}

} // namespace

void JournalValueTransfer::Check(const std::vector<scavenger::core::PaymentInstruction>& batch) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Balances                    scratch = balances_;
  for (const auto& payment : batch) {
    Apply(scratch, payment.from, payment.to, payment.amount);
  }
}

void JournalValueTransfer::Pay(const std::string& from, const std::string& to, uint64_t amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  Apply(balances_, from, to, amount);
  journal_.push_back(JournalEntry{from, to, amount, scavenger::util::NowMillis()});

  SCAVENGER_LOG_INFO("payment", {StringField("from", from), StringField("to", to), UintField("amount", amount)});
}

std::vector<JournalEntry> JournalValueTransfer::Journal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return journal_;
}

int64_t JournalValueTransfer::BalanceOf(const std::string& participant) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = balances_.find(participant);
  return it == balances_.end() ? 0 : it->second;
}

} // namespace scavenger::payments
