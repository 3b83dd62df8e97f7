/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file sqlite_adapter.hpp
 * @brief Boundary layer between the SQLite C API and the UuidKit core.
 *
 * @details
 * This header is the only place where SQLite types meet UuidKit types.
 *
 * ## Architecture
 * 1. **Raw Interface (`extern "C"`)**: the extension entry point that SQLite
 * resolves by name, and a helper that installs it as an auto-extension.
 * 2. **Adapter (`uuidkit::ffi`)**: converts `sqlite3_value` handles into
 * `core::Value`, converts core results into `sqlite3_result_*` calls, and
 * registers the function table through an abstract `Registrar` so that the
 * registration logic can be exercised without a live connection.
 *
 * ## Build Modes
 * The same sources serve two builds:
 * - **In-process** (`SQLITE_CORE` defined): the core library, the shell and
 * the tests link SQLite and call it directly.
 * - **Loadable module** (`SQLITE_CORE` undefined): `<sqlite3ext.h>` routes
 * every `sqlite3_*` call through the `sqlite3_api_routines` table the host
 * hands to `sqlite3_uuid_init`, so the module never links a SQLite of its own.
 */

#pragma once

#include "uuidkit/core/codec.hpp"

#include <sqlite3ext.h>
#include <string>
#include <vector>

// ============================================================================
//  RAW ENTRY POINTS (C ABI)
// ============================================================================

extern "C" {

/**
 * @brief SQLite extension entry point.
 *
 * Registers `uuid`, `uuid_str`, `uuid_blob`, `uuid7` and `uuid7_blob` on `db`.
 *
 * @param db The connection to extend.
 * @param pz_err_msg If non-null and registration fails, receives a message
 * allocated with `sqlite3_mprintf` (SQLite frees it).
 * @param p_api The host's API routine table. Required when loaded as a module;
 * ignored in the in-process build.
 * @return `SQLITE_OK`, or the first non-OK code returned by
 * `sqlite3_create_function_v2`. Registration stops at that failure.
 */
int sqlite3_uuid_init(sqlite3* db, char** pz_err_msg, const sqlite3_api_routines* p_api);

/**
 * @brief Installs `sqlite3_uuid_init` as an automatic extension.
 *
 * Every connection opened afterwards in this process gets the UUID functions.
 * Installing it more than once is harmless. Only available in the in-process
 * build; a loaded module has no API table until the host calls its entry point.
 *
 * @return The code returned by `sqlite3_auto_extension`, or `SQLITE_MISUSE`
 * when called from the loadable module.
 */
int uuidkit_register_auto_extension(void);

} // extern "C"

// ============================================================================
//  ADAPTER (C++)
// ============================================================================

namespace uuidkit::ffi {

/// Signature of a SQLite scalar function implementation.
using ScalarFunction = void (*)(sqlite3_context*, int, sqlite3_value**);

/// Flags for generators: result differs between calls with identical arguments.
constexpr int kVolatileFlags = SQLITE_UTF8 | SQLITE_INNOCUOUS;

/// Flags for decode-then-reencode forms: result depends only on the argument.
constexpr int kDeterministicFlags = kVolatileFlags | SQLITE_DETERMINISTIC;

/**
 * @struct FunctionSpec
 * @brief One row of the registration table: a named overload of fixed arity.
 */
struct FunctionSpec {
    const char* name;
    int arity;
    int flags;
    ScalarFunction callback;
};

/**
 * @class Registrar
 * @brief Abstract capability to register a scalar function with a host engine.
 */
class Registrar {
  public:
    virtual ~Registrar() = default;

    /**
     * @brief Registers one overload.
     *
     * @return `SQLITE_OK` on success, any other SQLite code on failure.
     */
    virtual int register_function(const FunctionSpec& spec) = 0;
};

/**
 * @class SqliteRegistrar
 * @brief `Registrar` backed by `sqlite3_create_function_v2` on a live connection.
 *
 * Does not own the connection.
 */
class SqliteRegistrar : public Registrar {
  public:
    explicit SqliteRegistrar(sqlite3* db) : db_(db) {}

    int register_function(const FunctionSpec& spec) override;

  private:
    sqlite3* db_;
};

/**
 * @brief The UUID function table in registration order.
 *
 * `uuid7`, `uuid7_blob`/0, `uuid7_blob`/1, `uuid`, `uuid_str`, `uuid_blob`/0,
 * `uuid_blob`/1. Zero-argument generators carry `kVolatileFlags`; the
 * one-argument forms carry `kDeterministicFlags`.
 */
const std::vector<FunctionSpec>& function_table();

/**
 * @brief Registers every entry of `function_table()` in order.
 *
 * Stops at the first rejected registration and returns its code; entries
 * already registered are left in place.
 *
 * @param registrar Target of the registrations.
 * @param error_message If non-null and a registration fails, receives a
 * description naming the function, its arity and the code.
 * @return int `SQLITE_OK`, or the first failing code.
 */
int register_functions(Registrar& registrar, std::string* error_message = nullptr);

/**
 * @brief Converts a SQLite argument into the codec's dynamic value.
 *
 * TEXT becomes a `std::string_view` over the UTF-8 bytes, BLOB becomes a
 * `core::Blob`, everything else (NULL, INTEGER, FLOAT, a null handle)
 * becomes `std::monostate`. The views are valid only until the callback that
 * owns `arg` returns.
 */
core::Value to_value(sqlite3_value* arg);

} // namespace uuidkit::ffi
