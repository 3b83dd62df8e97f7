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
 * @file sqlite_adapter.cpp
 * @brief SQLite callbacks, registration table and extension entry points.
 *
 * @details
 * Every callback follows the same shape: marshal the argument (if any) into
 * a `core::Value`, dispatch on `argc`, call into `core::Functions`, and hand
 * the outcome back with `sqlite3_result_*`. Results are passed with
 * `SQLITE_TRANSIENT` so SQLite copies them before the local buffers die.
 *
 * ## Exception Boundary
 * No C++ exception may unwind through SQLite's C frames. Each callback body
 * runs inside `guarded`, which turns an exception into a statement error.
 */

#include "uuidkit/ffi/sqlite_adapter.hpp"

#include "uuidkit/core/functions.hpp"
#include "uuidkit/infra/logger.hpp"

#include <exception>
#include <new>
#include <optional>

SQLITE_EXTENSION_INIT1

namespace uuidkit::ffi {

namespace {

// ------------------------------------------------------------------------
// Result marshaling
// ------------------------------------------------------------------------

void result_text(sqlite3_context* ctx, const std::string& text)
{
    sqlite3_result_text(ctx, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

void result_text(sqlite3_context* ctx, const std::optional<std::string>& text)
{
    if (!text) {
        sqlite3_result_null(ctx);
        return;
    }
    result_text(ctx, *text);
}

void result_blob(sqlite3_context* ctx, const core::Bytes& bytes)
{
    sqlite3_result_blob(ctx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void result_blob(sqlite3_context* ctx, const std::optional<core::Bytes>& bytes)
{
    if (!bytes) {
        sqlite3_result_null(ctx);
        return;
    }
    result_blob(ctx, *bytes);
}

/**
 * @brief Runs a callback body, converting exceptions into SQLite errors.
 *
 * Allocation failure maps to `SQLITE_NOMEM`; any other exception (typically
 * the entropy source failing) is logged as FATAL and reported as the
 * statement's error message.
 */
template <typename Body> void guarded(sqlite3_context* ctx, const char* name, Body&& body)
{
    try {
        body();
    } catch (const std::bad_alloc&) {
        sqlite3_result_error_nomem(ctx);
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::FATAL,
                           std::string("Extension: ") + name + "() failed: " + e.what());
        sqlite3_result_error(ctx, e.what(), -1);
    }
}

// ------------------------------------------------------------------------
// Scalar function callbacks
// ------------------------------------------------------------------------

void uuid_func(sqlite3_context* ctx, int, sqlite3_value**)
{
    guarded(ctx, "uuid", [&] { result_text(ctx, core::Functions::uuid()); });
}

void uuid_str_func(sqlite3_context* ctx, int, sqlite3_value** argv)
{
    guarded(ctx, "uuid_str",
            [&] { result_text(ctx, core::Functions::uuid_str(to_value(argv[0]))); });
}

void uuid_blob_func(sqlite3_context* ctx, int argc, sqlite3_value** argv)
{
    guarded(ctx, "uuid_blob", [&] {
        if (argc == 0) {
            result_blob(ctx, core::Functions::uuid_blob());
            return;
        }
        result_blob(ctx, core::Functions::uuid_blob(to_value(argv[0])));
    });
}

void uuid7_func(sqlite3_context* ctx, int, sqlite3_value**)
{
    guarded(ctx, "uuid7", [&] { result_text(ctx, core::Functions::uuid7()); });
}

void uuid7_blob_func(sqlite3_context* ctx, int argc, sqlite3_value** argv)
{
    guarded(ctx, "uuid7_blob", [&] {
        if (argc == 0) {
            result_blob(ctx, core::Functions::uuid7_blob());
            return;
        }
        result_blob(ctx, core::Functions::uuid7_blob(to_value(argv[0])));
    });
}

} // namespace

// ------------------------------------------------------------------------
// Argument marshaling
// ------------------------------------------------------------------------

/**
 * @details
 * `sqlite3_value_text` / `sqlite3_value_blob` are called before
 * `sqlite3_value_bytes`, the order SQLite requires for the byte count to
 * describe the returned pointer.
 */
core::Value to_value(sqlite3_value* arg)
{
    if (arg == nullptr) {
        return std::monostate{};
    }

    switch (sqlite3_value_type(arg)) {
    case SQLITE_TEXT: {
        const unsigned char* text = sqlite3_value_text(arg);
        if (text == nullptr) {
            return std::monostate{};
        }
        int size = sqlite3_value_bytes(arg);
        return std::string_view(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
    }
    case SQLITE_BLOB: {
        const void* data = sqlite3_value_blob(arg);
        int size = sqlite3_value_bytes(arg);
        return core::Blob{static_cast<const uint8_t*>(data), static_cast<size_t>(size)};
    }
    default:
        return std::monostate{};
    }
}

// ------------------------------------------------------------------------
// Registration
// ------------------------------------------------------------------------

int SqliteRegistrar::register_function(const FunctionSpec& spec)
{
    return sqlite3_create_function_v2(db_, spec.name, spec.arity, spec.flags, nullptr,
                                      spec.callback, nullptr, nullptr, nullptr);
}

const std::vector<FunctionSpec>& function_table()
{
    static const std::vector<FunctionSpec> table = {
        {"uuid7", 0, kVolatileFlags, uuid7_func},
        {"uuid7_blob", 0, kVolatileFlags, uuid7_blob_func},
        {"uuid7_blob", 1, kDeterministicFlags, uuid7_blob_func},
        {"uuid", 0, kVolatileFlags, uuid_func},
        {"uuid_str", 1, kDeterministicFlags, uuid_str_func},
        {"uuid_blob", 0, kVolatileFlags, uuid_blob_func},
        {"uuid_blob", 1, kDeterministicFlags, uuid_blob_func},
    };
    return table;
}

int register_functions(Registrar& registrar, std::string* error_message)
{
    for (const FunctionSpec& spec : function_table()) {
        int rc = registrar.register_function(spec);
        if (rc != SQLITE_OK) {
            std::string msg = std::string("failed to register ") + spec.name + "/" +
                              std::to_string(spec.arity) + ": " + sqlite3_errstr(rc);
            infra::Logger::log(infra::LogLevel::ERROR, "Extension: " + msg);
            if (error_message) {
                *error_message = msg;
            }
            return rc;
        }
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Extension: registered " + std::to_string(function_table().size()) +
                           " UUID function overloads");
    return SQLITE_OK;
}

} // namespace uuidkit::ffi

// ============================================================================
//  RAW ENTRY POINTS
// ============================================================================

extern "C" int sqlite3_uuid_init(sqlite3* db, char** pz_err_msg, const sqlite3_api_routines* p_api)
{
    SQLITE_EXTENSION_INIT2(p_api)

    try {
        uuidkit::ffi::SqliteRegistrar registrar(db);

        std::string error;
        int rc = uuidkit::ffi::register_functions(registrar, &error);
        if (rc != SQLITE_OK && pz_err_msg != nullptr) {
            *pz_err_msg = sqlite3_mprintf("uuidkit: %s", error.c_str());
        }
        return rc;
    } catch (const std::bad_alloc&) {
        return SQLITE_NOMEM;
    } catch (const std::exception&) {
        return SQLITE_ERROR;
    }
}

extern "C" int uuidkit_register_auto_extension(void)
{
#ifdef SQLITE_CORE
    return sqlite3_auto_extension(reinterpret_cast<void (*)(void)>(&sqlite3_uuid_init));
#else
    // Module build: sqlite3_api stays null until the host runs the entry point.
    return SQLITE_MISUSE;
#endif
}
