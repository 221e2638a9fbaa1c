#pragma once

#include <upid/result.hpp>

struct sqlite3;

namespace upid {

// Registers the UPID SQL functions on an open connection:
//
//   gen_upid(prefix)            -> TEXT     new identifier
//   upid_to_blob(text)          -> BLOB     16 raw bytes
//   upid_from_blob(blob)        -> TEXT
//   upid_to_uuid(text)          -> TEXT     xxxxxxxx-xxxx-...
//   upid_from_uuid(text)        -> TEXT
//   upid_to_milliseconds(text)  -> INTEGER
//   upid_to_timestamp(text)     -> TEXT     ISO-8601 UTC
//   upid_prefix(text)           -> TEXT
//
// NULL in gives NULL out. Malformed input raises an SQL error.
Status register_sqlite_functions(sqlite3* db);

} // namespace upid
