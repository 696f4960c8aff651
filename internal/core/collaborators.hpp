#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace scavenger::core {

/*
  External collaborator contracts.

  The engine never mutates participants, never holds value itself and never
  reads configuration directly; it only talks to these interfaces.
*/

enum class Capability {
  kParticipate,
  kSubmit,
  kCollect,
  kManufacture,
  kAdminister,
};

std::string_view CapabilityName(Capability capability);

class ParticipantDirectory {
 public:
  virtual ~ParticipantDirectory() = default;

  virtual bool HasCapability(const std::string& participant, Capability capability) const = 0;
};

struct PaymentInstruction {
  std::string from;
  std::string to;
  uint64_t    amount = 0;
};

// Moves reward units between participants. Throws on failure.
class ValueTransfer {
 public:
  virtual ~ValueTransfer() = default;

  // Throws what Pay would throw if the batch were paid in order now.
  // Moves nothing.
  virtual void Check(const std::vector<PaymentInstruction>& batch) const = 0;

  virtual void Pay(const std::string& from, const std::string& to, uint64_t amount) = 0;
};

struct RewardSplit {
  uint32_t collector_percent = 0;
  uint32_t owner_percent     = 0;
};

class RewardSplitSource {
 public:
  virtual ~RewardSplitSource() = default;

  virtual RewardSplit Split() const = 0;
};

} // namespace scavenger::core
