#pragma once

#include <memory>

#include "config/config.pb.h"

namespace scavenger::core { class ScavengerLedger; }
namespace scavenger::db { class Repository; }
namespace scavenger::directory { class StaticParticipantDirectory; }
namespace scavenger::payments { class JournalValueTransfer; }

namespace scavenger::factory {

/*
  Application

  Owns every long-lived object of one engine instance.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<directory::StaticParticipantDirectory> directory;
  std::shared_ptr<payments::JournalValueTransfer> payments;
  std::shared_ptr<core::ScavengerLedger> ledger;
};

/*
  Build

  Constructs the engine and its collaborators from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const scavenger::runtime::config::RuntimeConfig& config);

}
