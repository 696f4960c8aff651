#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "scavenger/ledger/v1.hpp"

namespace scavenger::db::sqlite {

using scavenger::db::ErrorCode;
using scavenger::db::Result;

namespace v1 = scavenger::ledger::v1;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static model::WasteRecord ReadWaste(sqlite3_stmt* st) {
    model::WasteRecord r;
    r.id            = ColU64(st, 0);
    r.category      = static_cast<v1::WasteCategory>(ColI32(st, 1));
    r.weight_grams  = ColU64(st, 2);
    r.submitter     = ColText(st, 3);
    r.current_owner = ColText(st, 4);
    r.status        = static_cast<v1::WasteStatus>(ColI32(st, 5));
    r.is_confirmed  = ColI32(st, 6) != 0;
    r.confirmer     = ColText(st, 7);
    r.is_active     = ColI32(st, 8) != 0;
    r.latitude      = ColI64(st, 9);
    r.longitude     = ColI64(st, 10);
    r.description   = ColText(st, 11);
    r.created_at_ms = ColU64(st, 12);
    return r;
}

static model::IncentiveRecord ReadIncentive(sqlite3_stmt* st) {
    model::IncentiveRecord r;
    r.id               = ColU64(st, 0);
    r.issuer           = ColText(st, 1);
    r.category         = static_cast<v1::WasteCategory>(ColI32(st, 2));
    r.reward_rate      = ColU64(st, 3);
    r.total_budget     = ColU64(st, 4);
    r.remaining_budget = ColU64(st, 5);
    r.active           = ColI32(st, 6) != 0;
    r.created_at_ms    = ColU64(st, 7);
    return r;
}

// Budgets are compared here, never in SQL: columns hold the signed bit
// pattern of uint64 values.
static Result CheckBudget(const model::IncentiveRecord& r) {
    if (r.remaining_budget > r.total_budget)
        return Result::Err(ErrorCode::ConstraintViolation,
                           "incentive " + std::to_string(r.id) + " remaining budget exceeds total budget");
    return Result::Ok();
}

// Runs a single-column id query with one bound text or int parameter.
template <typename Bind>
static std::vector<uint64_t> SelectIds(sqlite3* db, const char* sql, Bind bind) {
    std::vector<uint64_t> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    bind(st);

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ColU64(st, 0));
    }

    sqlite3_finalize(st);
    return out;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

uint64_t SqliteRepository::GetCounter(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT value FROM counters WHERE name=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return 0;

    BindText(st, 1, name);

    uint64_t value = 0;
    if (sqlite3_step(st) == SQLITE_ROW) {
        value = ColU64(st, 0);
    }

    sqlite3_finalize(st);
    return value;
}

Result SqliteRepository::SetCounter(Transaction& t, const std::string& name, uint64_t value) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO counters(name,value) VALUES(?,?) "
        "ON CONFLICT(name) DO UPDATE SET value=excluded.value;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, name);
    BindU64(st, 2, value);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Waste
// ------------------------------------------------------------------

Result SqliteRepository::InsertWaste(Transaction& t, const model::WasteRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO waste(id,category,weight_grams,submitter,current_owner,status,is_confirmed,"
        "confirmer,is_active,latitude,longitude,description,created_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.id);
    BindI32(st, 2, static_cast<int>(r.category));
    BindU64(st, 3, r.weight_grams);
    BindText(st, 4, r.submitter);
    BindText(st, 5, r.current_owner);
    BindI32(st, 6, static_cast<int>(r.status));
    BindI32(st, 7, r.is_confirmed ? 1 : 0);
    BindText(st, 8, r.confirmer);
    BindI32(st, 9, r.is_active ? 1 : 0);
    BindI64(st, 10, r.latitude);
    BindI64(st, 11, r.longitude);
    BindText(st, 12, r.description);
    BindU64(st, 13, r.created_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    // primary key clash is the only constraint an insert can hit
    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "waste " + std::to_string(r.id));

    return Translate(db, rc);
}

std::optional<model::WasteRecord>
SqliteRepository::GetWaste(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,category,weight_grams,submitter,current_owner,status,is_confirmed,"
        "confirmer,is_active,latitude,longitude,description,created_at_ms FROM waste WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindU64(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadWaste(st);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpdateWaste(Transaction& t, const model::WasteRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE waste SET weight_grams=?,current_owner=?,status=?,is_confirmed=?,confirmer=?,is_active=? "
        "WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.weight_grams);
    BindText(st, 2, r.current_owner);
    BindI32(st, 3, static_cast<int>(r.status));
    BindI32(st, 4, r.is_confirmed ? 1 : 0);
    BindText(st, 5, r.confirmer);
    BindI32(st, 6, r.is_active ? 1 : 0);
    BindU64(st, 7, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "waste " + std::to_string(r.id));

    return Translate(db, rc);
}

std::vector<model::WasteRecord> SqliteRepository::ListWastes(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,category,weight_grams,submitter,current_owner,status,is_confirmed,"
        "confirmer,is_active,latitude,longitude,description,created_at_ms FROM waste ORDER BY id;";

    std::vector<model::WasteRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadWaste(st));
    }

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Transfers
// ------------------------------------------------------------------

Result SqliteRepository::AppendTransfer(Transaction& t, const model::TransferRecord& r) {
    if (!GetWaste(t, r.waste_id))
        return Result::Err(ErrorCode::NotFound, "waste " + std::to_string(r.waste_id));

    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO transfers(id,waste_id,from_participant,to_participant,timestamp_ms,note) "
        "VALUES(?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.id);
    BindU64(st, 2, r.waste_id);
    BindText(st, 3, r.from);
    BindText(st, 4, r.to);
    BindU64(st, 5, r.timestamp_ms);
    BindText(st, 6, r.note);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::TransferRecord>
SqliteRepository::GetTransfers(Transaction& t, uint64_t waste_id) {
    auto* db = TX(t).Handle();

    // transfer ids are allocated in append order
    const char* sql =
        "SELECT id,waste_id,from_participant,to_participant,timestamp_ms,note "
        "FROM transfers WHERE waste_id=? ORDER BY id;";

    std::vector<model::TransferRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindU64(st, 1, waste_id);

    while (sqlite3_step(st) == SQLITE_ROW) {
        model::TransferRecord r;
        r.id           = ColU64(st, 0);
        r.waste_id     = ColU64(st, 1);
        r.from         = ColText(st, 2);
        r.to           = ColText(st, 3);
        r.timestamp_ms = ColU64(st, 4);
        r.note         = ColText(st, 5);
        out.push_back(std::move(r));
    }

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Participant index
// ------------------------------------------------------------------

Result SqliteRepository::LinkParticipantWaste(Transaction& t, const std::string& participant, uint64_t waste_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO participant_wastes(participant,waste_id) VALUES(?,?) "
        "ON CONFLICT(participant,waste_id) DO NOTHING;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, participant);
    BindU64(st, 2, waste_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<uint64_t>
SqliteRepository::GetParticipantWastes(Transaction& t, const std::string& participant) {
    return SelectIds(TX(t).Handle(),
                     "SELECT waste_id FROM participant_wastes WHERE participant=? ORDER BY seq;",
                     [&](sqlite3_stmt* st) { BindText(st, 1, participant); });
}

// ------------------------------------------------------------------
// Incentives
// ------------------------------------------------------------------

Result SqliteRepository::InsertIncentive(Transaction& t, const model::IncentiveRecord& r) {
    if (auto bound = CheckBudget(r); !bound)
        return bound;

    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO incentives(id,issuer,category,reward_rate,total_budget,remaining_budget,active,created_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.id);
    BindText(st, 2, r.issuer);
    BindI32(st, 3, static_cast<int>(r.category));
    BindU64(st, 4, r.reward_rate);
    BindU64(st, 5, r.total_budget);
    BindU64(st, 6, r.remaining_budget);
    BindI32(st, 7, r.active ? 1 : 0);
    BindU64(st, 8, r.created_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT && GetIncentive(t, r.id))
        return Result::Err(ErrorCode::AlreadyExists, "incentive " + std::to_string(r.id));

    return Translate(db, rc);
}

std::optional<model::IncentiveRecord>
SqliteRepository::GetIncentive(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,issuer,category,reward_rate,total_budget,remaining_budget,active,created_at_ms "
        "FROM incentives WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindU64(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadIncentive(st);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpdateIncentive(Transaction& t, const model::IncentiveRecord& r) {
    auto current = GetIncentive(t, r.id);
    if (!current)
        return Result::Err(ErrorCode::NotFound, "incentive " + std::to_string(r.id));

    // issuer and category are index keys and never change
    if (current->issuer != r.issuer || current->category != r.category)
        return Result::Err(ErrorCode::ConstraintViolation, "incentive issuer/category are immutable");

    if (auto bound = CheckBudget(r); !bound)
        return bound;

    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE incentives SET reward_rate=?,total_budget=?,remaining_budget=?,active=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.reward_rate);
    BindU64(st, 2, r.total_budget);
    BindU64(st, 3, r.remaining_budget);
    BindI32(st, 4, r.active ? 1 : 0);
    BindU64(st, 5, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<uint64_t>
SqliteRepository::ListIncentivesByIssuer(Transaction& t, const std::string& issuer) {
    return SelectIds(TX(t).Handle(),
                     "SELECT id FROM incentives WHERE issuer=? ORDER BY id;",
                     [&](sqlite3_stmt* st) { BindText(st, 1, issuer); });
}

std::vector<uint64_t>
SqliteRepository::ListIncentivesByCategory(Transaction& t, v1::WasteCategory category) {
    return SelectIds(TX(t).Handle(),
                     "SELECT id FROM incentives WHERE category=? ORDER BY id;",
                     [&](sqlite3_stmt* st) { BindI32(st, 1, static_cast<int>(category)); });
}

// ------------------------------------------------------------------
// Earnings
// ------------------------------------------------------------------

std::optional<model::EarningsRecord>
SqliteRepository::GetEarnings(Transaction& t, const std::string& participant) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT participant,total_earned,updated_at_ms FROM participant_earnings WHERE participant=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, participant);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::EarningsRecord r;
    r.participant   = ColText(st, 0);
    r.total_earned  = ColU64(st, 1);
    r.updated_at_ms = ColU64(st, 2);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpsertEarnings(Transaction& t, const model::EarningsRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO participant_earnings(participant,total_earned,updated_at_ms) VALUES(?,?,?) "
        "ON CONFLICT(participant) DO UPDATE SET total_earned=excluded.total_earned, "
        "updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.participant);
    BindU64(st, 2, r.total_earned);
    BindU64(st, 3, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Submission activity
// ------------------------------------------------------------------

std::optional<model::ParticipantActivityRecord>
SqliteRepository::GetParticipantActivity(Transaction& t, const std::string& participant) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT participant,total_submissions,total_weight_grams,updated_at_ms "
        "FROM participant_activity WHERE participant=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, participant);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::ParticipantActivityRecord r;
    r.participant        = ColText(st, 0);
    r.total_submissions  = ColU64(st, 1);
    r.total_weight_grams = ColU64(st, 2);
    r.updated_at_ms      = ColU64(st, 3);
    sqlite3_finalize(st);

    const char* by_category_sql =
        "SELECT category,submissions FROM participant_category_submissions WHERE participant=? ORDER BY category;";

    if (sqlite3_prepare_v2(db, by_category_sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, participant);
    while (sqlite3_step(st) == SQLITE_ROW) {
        r.submissions_by_category[static_cast<v1::WasteCategory>(ColI32(st, 0))] = ColU64(st, 1);
    }

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpsertParticipantActivity(Transaction& t, const model::ParticipantActivityRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO participant_activity(participant,total_submissions,total_weight_grams,updated_at_ms) VALUES(?,?,?,?) "
        "ON CONFLICT(participant) DO UPDATE SET total_submissions=excluded.total_submissions, "
        "total_weight_grams=excluded.total_weight_grams, updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.participant);
    BindU64(st, 2, r.total_submissions);
    BindU64(st, 3, r.total_weight_grams);
    BindU64(st, 4, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    const char* clear_sql = "DELETE FROM participant_category_submissions WHERE participant=?;";

    if (sqlite3_prepare_v2(db, clear_sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.participant);
    rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    const char* insert_sql =
        "INSERT INTO participant_category_submissions(participant,category,submissions) VALUES(?,?,?);";

    for (const auto& [category, submissions] : r.submissions_by_category) {
        if (sqlite3_prepare_v2(db, insert_sql, -1, &st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindText(st, 1, r.participant);
        BindI32(st, 2, static_cast<int>(category));
        BindU64(st, 3, submissions);

        rc = sqlite3_step(st);
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE)
            return Translate(db, rc);
    }

    return Result::Ok();
}

} // namespace scavenger::db::sqlite
