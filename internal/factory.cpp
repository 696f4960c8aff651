#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/config/static_reward_split.hpp"
#include "internal/core/engine_context.hpp"
#include "internal/core/scavenger_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/directory/static_participant_directory.hpp"
#include "internal/observability/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payments/journal_value_transfer.hpp"
#if SCAVENGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace scavenger::factory {

using namespace scavenger;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const scavenger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SCAVENGER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    SCAVENGER_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"),
                                            observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  SCAVENGER_LOG_INFO("repository ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const scavenger::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.directory = std::make_shared<directory::StaticParticipantDirectory>(directory::StaticParticipantDirectory::FromConfig(config));
  app.payments  = std::make_shared<payments::JournalValueTransfer>();

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  core::EngineContext ctx;
  ctx.repository = app.repository;
  ctx.directory  = app.directory;
  ctx.payments   = app.payments;
  ctx.split      = std::make_shared<scavenger::config::StaticRewardSplit>(scavenger::config::StaticRewardSplit::FromConfig(config.settlement()));
  ctx.events     = std::make_shared<observability::LoggingEventSink>();

  app.ledger = std::make_shared<core::ScavengerLedger>(std::move(ctx));

  SCAVENGER_LOG_INFO("ledger ready", {observability::UintField("participants", static_cast<uint64_t>(config.participants_size())),
                                      observability::UintField("collector_percent", config.settlement().collector_percent()),
                                      observability::UintField("owner_percent", config.settlement().owner_percent())});
  return app;
}

} // namespace scavenger::factory
