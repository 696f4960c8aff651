#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/static_reward_split.hpp"
#include "internal/directory/static_participant_directory.hpp"
#include "internal/util/errors.hpp"

namespace {

using scavenger::config::ConfigLoader;
using scavenger::core::Capability;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "scavenger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/scavenger/ledger.db"
    wal_mode: true
settlement:
  collector_percent: 10
  owner_percent: 20
participants:
  - id: alice
    role: recycler
  - id: bob
    role: collector
  - id: mill
    role: manufacturer
    admin: true
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/scavenger/ledger.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.settlement().collector_percent() == 10);
  assert(config.settlement().owner_percent() == 20);
  assert(config.participants_size() == 3);
  assert(config.participants(2).id() == "mill");
  assert(config.participants(2).admin());
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\scavenger\\\"quoted\"\\db.sqlite"
participants:
  - id: "1234"
    role: recycler
  - id: "true"
    role: collector
)");

  assert(config.database().sqlite().path() == "C:\\scavenger\\\"quoted\"\\db.sqlite");
  assert(config.participants(0).id() == "1234");
  assert(config.participants(1).id() == "true");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
server:
  bind_address: "0.0.0.0:50051"
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  assert(Throws<std::runtime_error>([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/scavenger.yaml"); }));
}

void TestSemanticValidation() {
  assert(Throws<scavenger::util::InvalidInput>([] {
    (void)ConfigLoader::LoadFromYamlString(R"(settlement:
  collector_percent: 70
  owner_percent: 31
)");
  }));

  assert(Throws<scavenger::util::InvalidInput>([] {
    (void)ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    wal_mode: true
)");
  }));

  assert(Throws<scavenger::util::InvalidInput>([] {
    (void)ConfigLoader::LoadFromYamlString(R"(participants:
  - id: alice
    role: janitor
)");
  }));

  assert(Throws<scavenger::util::InvalidInput>([] {
    (void)ConfigLoader::LoadFromYamlString(R"(participants:
  - id: alice
    role: recycler
  - id: alice
    role: collector
)");
  }));

  assert(Throws<scavenger::util::InvalidInput>([] {
    (void)ConfigLoader::LoadFromYamlString(R"(participants:
  - role: recycler
)");
  }));

  // shares summing to exactly 100 leave the holder nothing, which is allowed
  const auto config = ConfigLoader::LoadFromYamlString(R"(settlement:
  collector_percent: 40
  owner_percent: 60
)");
  assert(config.settlement().collector_percent() == 40);
}

void TestDirectoryFromConfig() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
participants:
  - id: alice
    role: recycler
  - id: bob
    role: collector
  - id: mill
    role: manufacturer
  - id: root
    role: recycler
    admin: true
)");
  assert(config.database().has_memory());

  const auto directory = scavenger::directory::StaticParticipantDirectory::FromConfig(config);

  assert(directory.HasCapability("alice", Capability::kParticipate));
  assert(directory.HasCapability("alice", Capability::kSubmit));
  assert(!directory.HasCapability("alice", Capability::kCollect));
  assert(!directory.HasCapability("alice", Capability::kAdminister));

  assert(directory.HasCapability("bob", Capability::kSubmit));
  assert(directory.HasCapability("bob", Capability::kCollect));
  assert(!directory.HasCapability("bob", Capability::kManufacture));

  assert(directory.HasCapability("mill", Capability::kManufacture));
  assert(!directory.HasCapability("mill", Capability::kSubmit));

  assert(directory.HasCapability("root", Capability::kAdminister));
  assert(!directory.HasCapability("nobody", Capability::kParticipate));

  scavenger::directory::StaticParticipantDirectory manual;
  assert(Throws<scavenger::util::InvalidInput>([&] { manual.Register("eve", "auditor"); }));
}

void TestRewardSplit() {
  const auto split = scavenger::config::StaticRewardSplit(scavenger::core::RewardSplit{15, 25}).Split();
  assert(split.collector_percent == 15);
  assert(split.owner_percent == 25);

  assert(Throws<scavenger::util::InvalidInput>([] { (void)scavenger::config::StaticRewardSplit(scavenger::core::RewardSplit{50, 51}); }));

  scavenger::runtime::config::SettlementConfig settlement;
  settlement.set_collector_percent(5);
  settlement.set_owner_percent(10);
  const auto from_config = scavenger::config::StaticRewardSplit::FromConfig(settlement).Split();
  assert(from_config.collector_percent == 5);
  assert(from_config.owner_percent == 10);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestSemanticValidation();
  TestDirectoryFromConfig();
  TestRewardSplit();

  std::cout << "scavenger_unit_config_loader: pass\n";
  return 0;
}
