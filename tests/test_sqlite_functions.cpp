#include <catch2/catch.hpp>
#include <upid/sqlite_functions.hpp>
#include <upid/core/upid.hpp>
#include <sqlite3.h>
#include <string>
#include <vector>

using namespace upid;

namespace {

// In-memory connection with the UPID functions registered
struct TestDb {
    sqlite3* db = nullptr;

    TestDb() {
        sqlite3_open(":memory:", &db);
        auto r = register_sqlite_functions(db);
        REQUIRE(r.is_ok());
    }
    ~TestDb() { sqlite3_close(db); }

    // Runs a single-row, single-column query. Returns false on SQL error.
    bool query_text(const std::string& sql, std::string& out, std::string& err) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            err = sqlite3_errmsg(db);
            return false;
        }
        int rc = sqlite3_step(stmt);
        bool ok = rc == SQLITE_ROW;
        if (ok) {
            auto text = sqlite3_column_text(stmt, 0);
            out = text ? reinterpret_cast<const char*>(text) : "<null>";
        } else {
            err = sqlite3_errmsg(db);
        }
        sqlite3_finalize(stmt);
        return ok;
    }

    std::string text(const std::string& sql) {
        std::string out, err;
        bool ok = query_text(sql, out, err);
        INFO(sql << " -> " << err);
        REQUIRE(ok);
        return out;
    }

    std::string error(const std::string& sql) {
        std::string out, err;
        REQUIRE_FALSE(query_text(sql, out, err));
        return err;
    }
};

const char* kKnown = "user_aaccvpp5guht4dts56je5a";

} // namespace

TEST_CASE("register_sqlite_functions rejects a null connection", "[sqlite]") {
    auto r = register_sqlite_functions(nullptr);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UpidError::Database);
}

TEST_CASE("gen_upid produces parseable identifiers", "[sqlite]") {
    TestDb t;
    auto text = t.text("SELECT gen_upid('user')");
    auto parsed = Upid::from_string(text);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().prefix() == "user");

    auto bare = Upid::from_string(t.text("SELECT gen_upid()"));
    REQUIRE(bare.is_ok());
    REQUIRE(bare.value().prefix() == "zzzz");
}

TEST_CASE("gen_upid is not constant-folded across rows", "[sqlite]") {
    TestDb t;
    auto n = t.text(
        "WITH RECURSIVE n(i) AS (SELECT 1 UNION ALL SELECT i + 1 FROM n WHERE i < 50) "
        "SELECT COUNT(DISTINCT gen_upid('row')) FROM n");
    REQUIRE(n == "50");
}

TEST_CASE("upid_prefix and upid_to_milliseconds", "[sqlite]") {
    TestDb t;
    REQUIRE(t.text(std::string("SELECT upid_prefix('") + kKnown + "')") == "user");

    auto u = Upid::from_prefix_and_milliseconds("user", 1720568902000);
    REQUIRE(t.text("SELECT upid_to_milliseconds('" + u.to_string() + "')") == "1720568901888");
    REQUIRE(t.text("SELECT upid_to_timestamp('" + u.to_string() + "')")
            == "2024-07-09T23:48:21.888Z");
}

TEST_CASE("upid blob round trip", "[sqlite]") {
    TestDb t;
    REQUIRE(t.text(std::string("SELECT hex(upid_to_blob('") + kKnown + "'))")
            == "31908DD6A3669B912738191EA3D61576");
    REQUIRE(t.text(std::string("SELECT upid_from_blob(upid_to_blob('") + kKnown + "'))")
            == kKnown);
    REQUIRE(t.text("SELECT length(upid_to_blob(gen_upid('user')))") == "16");
}

TEST_CASE("upid uuid round trip", "[sqlite]") {
    TestDb t;
    REQUIRE(t.text(std::string("SELECT upid_to_uuid('") + kKnown + "')")
            == "31908dd6-a366-9b91-2738-191ea3d61576");
    REQUIRE(t.text("SELECT upid_from_uuid('31908dd6-a366-9b91-2738-191ea3d61576')") == kKnown);
}

TEST_CASE("NULL arguments give NULL", "[sqlite]") {
    TestDb t;
    REQUIRE(t.text("SELECT upid_prefix(NULL)") == "<null>");
    REQUIRE(t.text("SELECT upid_to_blob(NULL)") == "<null>");
    REQUIRE(t.text("SELECT upid_from_blob(NULL)") == "<null>");
    REQUIRE(t.text("SELECT upid_from_uuid(NULL)") == "<null>");
}

TEST_CASE("invalid input raises SQL errors", "[sqlite]") {
    TestDb t;
    auto err = t.error("SELECT upid_prefix('user_short')");
    REQUIRE(err.find("26 characters") != std::string::npos);

    auto overflow = t.error("SELECT upid_to_blob('zzzz_zzzzzzzzzzzzzzzzzzzzzz')");
    REQUIRE(overflow.find("overflows") != std::string::npos);

    t.error("SELECT upid_from_blob(x'0102')");
    t.error("SELECT upid_from_uuid('not-a-uuid')");
}

TEST_CASE("blob column sorts by creation time", "[sqlite]") {
    TestDb t;
    REQUIRE(sqlite3_exec(t.db, "CREATE TABLE ids (id BLOB PRIMARY KEY)",
                         nullptr, nullptr, nullptr) == SQLITE_OK);

    std::vector<Upid> ids;
    for (uint64_t i = 0; i < 5; ++i) {
        ids.push_back(Upid::from_prefix_and_milliseconds("user", 1720568902000 + i * 1000));
    }
    // insert newest first
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        std::string sql = "INSERT INTO ids VALUES (upid_to_blob('" + it->to_string() + "'))";
        REQUIRE(sqlite3_exec(t.db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    }

    REQUIRE(t.text("SELECT upid_from_blob(id) FROM ids ORDER BY id LIMIT 1")
            == ids.front().to_string());
}
