#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/collaborators.hpp"

namespace scavenger::payments {

struct JournalEntry {
  std::string from;
  std::string to;
  uint64_t    amount       = 0;
  uint64_t    timestamp_ms = 0;
};

/*
  In-process value transfer.

  Every payment is logged and appended to a journal; balances are net
  (received minus sent) and may go negative for issuers, who are assumed
  to fund programs out of band.
*/
class JournalValueTransfer final : public scavenger::core::ValueTransfer {
 public:
  void Check(const std::vector<scavenger::core::PaymentInstruction>& batch) const override;

  void Pay(const std::string& from, const std::string& to, uint64_t amount) override;

  std::vector<JournalEntry> Journal() const;

  int64_t BalanceOf(const std::string& participant) const;

 private:
  mutable std::mutex                       mutex_;
  std::vector<JournalEntry>                journal_;
  std::unordered_map<std::string, int64_t> balances_;
};

} // namespace scavenger::payments
