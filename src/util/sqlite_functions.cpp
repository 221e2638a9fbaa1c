#include <upid/sqlite_functions.hpp>
#include <upid/core/upid.hpp>
#include <upid/log.hpp>
#include <sqlite3.h>

#include <string>
#include <vector>

namespace upid {

static std::string text_arg(sqlite3_value* v) {
    const unsigned char* s = sqlite3_value_text(v);
    int n = sqlite3_value_bytes(v);
    return s ? std::string(reinterpret_cast<const char*>(s), static_cast<size_t>(n)) : "";
}

static void result_text(sqlite3_context* ctx, const std::string& s) {
    sqlite3_result_text(ctx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void result_error(sqlite3_context* ctx, const UpidError& e) {
    std::string msg = e.message;
    if (!e.hint.empty()) msg += " (" + e.hint + ")";
    sqlite3_result_error(ctx, msg.c_str(), static_cast<int>(msg.size()));
}

// Parses argv[0] as UPID text; reports NULL or an error on the context and
// returns false when there is nothing further to do.
static bool upid_arg(sqlite3_context* ctx, sqlite3_value** argv, Upid& out) {
    if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return false;
    }
    auto r = Upid::from_string(text_arg(argv[0]));
    if (r.is_err()) {
        result_error(ctx, r.error());
        return false;
    }
    out = r.value();
    return true;
}

// ---- SQL functions ----

static void fn_gen_upid(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    std::string prefix;
    if (argc > 0 && sqlite3_value_type(argv[0]) != SQLITE_NULL) {
        prefix = text_arg(argv[0]);
    }
    result_text(ctx, Upid::from_prefix(prefix).to_string());
}

static void fn_to_blob(sqlite3_context* ctx, int, sqlite3_value** argv) {
    Upid u;
    if (!upid_arg(ctx, argv, u)) return;
    sqlite3_result_blob(ctx, u.bytes().data(), static_cast<int>(u.bytes().size()),
                        SQLITE_TRANSIENT);
}

static void fn_from_blob(sqlite3_context* ctx, int, sqlite3_value** argv) {
    if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }
    auto data = static_cast<const uint8_t*>(sqlite3_value_blob(argv[0]));
    int n = sqlite3_value_bytes(argv[0]);
    std::vector<uint8_t> raw;
    if (data && n > 0) raw.assign(data, data + n);

    auto r = Upid::from_bytes(raw);
    if (r.is_err()) {
        result_error(ctx, r.error());
        return;
    }
    result_text(ctx, r.value().to_string());
}

static void fn_to_uuid(sqlite3_context* ctx, int, sqlite3_value** argv) {
    Upid u;
    if (!upid_arg(ctx, argv, u)) return;
    result_text(ctx, u.to_uuid().to_string());
}

static void fn_from_uuid(sqlite3_context* ctx, int, sqlite3_value** argv) {
    if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }
    auto r = Uuid::from_string(text_arg(argv[0]));
    if (r.is_err()) {
        result_error(ctx, r.error());
        return;
    }
    result_text(ctx, Upid::from_uuid(r.value()).to_string());
}

static void fn_to_milliseconds(sqlite3_context* ctx, int, sqlite3_value** argv) {
    Upid u;
    if (!upid_arg(ctx, argv, u)) return;
    sqlite3_result_int64(ctx, static_cast<sqlite3_int64>(u.milliseconds()));
}

static void fn_to_timestamp(sqlite3_context* ctx, int, sqlite3_value** argv) {
    Upid u;
    if (!upid_arg(ctx, argv, u)) return;
    result_text(ctx, u.datetime_string());
}

static void fn_prefix(sqlite3_context* ctx, int, sqlite3_value** argv) {
    Upid u;
    if (!upid_arg(ctx, argv, u)) return;
    result_text(ctx, u.prefix());
}

// ---- Registration ----

struct SqlFunction {
    const char* name;
    int nargs;
    bool deterministic;
    void (*fn)(sqlite3_context*, int, sqlite3_value**);
};

static const SqlFunction k_functions[] = {
    {"gen_upid",             1, false, fn_gen_upid},
    {"gen_upid",             0, false, fn_gen_upid},
    {"upid_to_blob",         1, true,  fn_to_blob},
    {"upid_from_blob",       1, true,  fn_from_blob},
    {"upid_to_uuid",         1, true,  fn_to_uuid},
    {"upid_from_uuid",       1, true,  fn_from_uuid},
    {"upid_to_milliseconds", 1, true,  fn_to_milliseconds},
    {"upid_to_timestamp",    1, true,  fn_to_timestamp},
    {"upid_prefix",          1, true,  fn_prefix},
};

Status register_sqlite_functions(sqlite3* db) {
    if (!db) {
        return UpidError(UpidError::Database, "cannot register UPID functions on a null connection");
    }
    for (const auto& f : k_functions) {
        int flags = SQLITE_UTF8;
        if (f.deterministic) flags |= SQLITE_DETERMINISTIC;
        int rc = sqlite3_create_function_v2(db, f.name, f.nargs, flags, nullptr,
                                            f.fn, nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            return UpidError(UpidError::Database,
                std::string("Failed to register SQL function ") + f.name + ": " + sqlite3_errmsg(db));
        }
        log::trace("registered SQL function %s/%d", f.name, f.nargs);
    }
    return ok_status();
}

} // namespace upid
