#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace kinship::db::sqlite {

using kinship::db::ErrorCode;
using kinship::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static bool ColBool(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col) != 0;
}

static void ThrowIfError(const Result& r, const char* what) {
    if (!r) throw std::runtime_error(std::string(what) + ": " + r.message);
}

static constexpr const char* kEdgeColumns =
    "SELECT id,person_id,related_person_id,relationship_type,is_active FROM person_relationship ";

static model::RelationshipRecord ReadEdge(sqlite3_stmt* st) {
    model::RelationshipRecord r;
    r.id = ColText(st, 0);
    r.person_id = ColText(st, 1);
    r.related_person_id = ColText(st, 2);
    r.relationship_type = ColText(st, 3);
    r.is_active = ColBool(st, 4);
    return r;
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
// Relationship edges
// ------------------------------------------------------------------

std::vector<model::RelationshipRecord> SqliteRepository::LoadAllEdges(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kEdgeColumns) + "WHERE is_active=1 ORDER BY id;";

    sqlite3_stmt* st = db_->Prepare(sql);

    std::vector<model::RelationshipRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadEdge(st));
    }
    sqlite3_finalize(st);

    ThrowIfError(Translate(db, rc), "load edges");
    return out;
}

std::vector<model::RelationshipRecord>
SqliteRepository::LoadEdgesTouching(Transaction& t, const std::string& person_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kEdgeColumns) +
        "WHERE is_active=1 AND (person_id=?1 OR related_person_id=?1) ORDER BY id;";

    sqlite3_stmt* st = db_->Prepare(sql);

    BindText(st, 1, person_id);

    std::vector<model::RelationshipRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadEdge(st));
    }
    sqlite3_finalize(st);

    ThrowIfError(Translate(db, rc), "load edges touching");
    return out;
}

// ------------------------------------------------------------------
// Person attributes
// ------------------------------------------------------------------

std::optional<model::PersonRecord>
SqliteRepository::LookupPerson(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,first_name,middle_name,last_name,gender_id,date_of_birth,date_of_death,marital_status "
        "FROM person WHERE id=?;";

    sqlite3_stmt* st = db_->Prepare(sql);

    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        ThrowIfError(Translate(db, rc), "lookup person");
        return std::nullopt;
    }

    model::PersonRecord r;
    r.id = ColText(st, 0);
    r.first_name = ColText(st, 1);
    r.middle_name = ColText(st, 2);
    r.last_name = ColText(st, 3);
    r.gender_id = ColText(st, 4);
    r.date_of_birth = ColText(st, 5);
    r.date_of_death = ColText(st, 6);
    r.marital_status = ColText(st, 7);

    sqlite3_finalize(st);
    return r;
}

std::optional<model::AddressRecord>
SqliteRepository::LookupCurrentAddress(Transaction& t, const std::string& person_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT pa.person_id,pa.country_id,pa.state_id,pa.district_id,pa.sub_district_id,pa.locality_id,"
        "c.name,s.name,d.name,sd.name,l.name "
        "FROM person_address pa "
        "LEFT JOIN address_country c ON c.id=pa.country_id "
        "LEFT JOIN address_state s ON s.id=pa.state_id "
        "LEFT JOIN address_district d ON d.id=pa.district_id "
        "LEFT JOIN address_sub_district sd ON sd.id=pa.sub_district_id "
        "LEFT JOIN address_locality l ON l.id=pa.locality_id "
        "WHERE pa.person_id=? AND pa.is_current=1 ORDER BY pa.id LIMIT 1;";

    sqlite3_stmt* st = db_->Prepare(sql);

    BindText(st, 1, person_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        ThrowIfError(Translate(db, rc), "lookup address");
        return std::nullopt;
    }

    model::AddressRecord r;
    r.person_id = ColText(st, 0);
    r.country_id = ColText(st, 1);
    r.state_id = ColText(st, 2);
    r.district_id = ColText(st, 3);
    r.sub_district_id = ColText(st, 4);
    r.locality_id = ColText(st, 5);
    r.country_name = ColText(st, 6);
    r.state_name = ColText(st, 7);
    r.district_name = ColText(st, 8);
    r.sub_district_name = ColText(st, 9);
    r.locality_name = ColText(st, 10);

    sqlite3_finalize(st);
    return r;
}

std::optional<model::ReligionRecord>
SqliteRepository::LookupReligion(Transaction& t, const std::string& person_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT pr.person_id,pr.religion_id,pr.religion_category_id,pr.religion_sub_category_id,r.name,c.name,sc.name "
        "FROM person_religion pr "
        "LEFT JOIN religion r ON r.id=pr.religion_id "
        "LEFT JOIN religion_category c ON c.id=pr.religion_category_id "
        "LEFT JOIN religion_sub_category sc ON sc.id=pr.religion_sub_category_id "
        "WHERE pr.person_id=? ORDER BY pr.id LIMIT 1;";

    sqlite3_stmt* st = db_->Prepare(sql);

    BindText(st, 1, person_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        ThrowIfError(Translate(db, rc), "lookup religion");
        return std::nullopt;
    }

    model::ReligionRecord r;
    r.person_id = ColText(st, 0);
    r.religion_id = ColText(st, 1);
    r.category_id = ColText(st, 2);
    r.sub_category_id = ColText(st, 3);
    r.religion_name = ColText(st, 4);
    r.category_name = ColText(st, 5);
    r.sub_category_name = ColText(st, 6);

    sqlite3_finalize(st);
    return r;
}

} // namespace kinship::db::sqlite
