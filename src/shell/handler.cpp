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
 * @file handler.cpp
 * @brief Implementation of the shell's statement pipeline.
 *
 * @details
 * 1. **Prepare**: compile the statement; report syntax errors as JSON.
 * 2. **Step**: pull every row, converting each column to a cJSON node.
 * 3. **Respond**: serialize the response object and release it.
 */

#include "uuidkit/shell/handler.hpp"

#include "uuidkit/infra/logger.hpp"
#include "uuidkit/infra/string.hpp"

#include <cJSON.h>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace uuidkit::shell {

namespace {

/**
 * @class ScopedStatement
 * @brief Finalizes a prepared statement on every exit path.
 */
class ScopedStatement {
  public:
    explicit ScopedStatement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    ScopedStatement(const ScopedStatement&) = delete;
    ScopedStatement& operator=(const ScopedStatement&) = delete;

    ~ScopedStatement()
    {
        // Finalizing a null statement is a no-op.
        sqlite3_finalize(stmt_);
    }

    sqlite3_stmt* get() const
    {
        return stmt_;
    }

  private:
    sqlite3_stmt* stmt_;
};

/// Serializes and frees `root`.
std::string serialize(cJSON* root)
{
    char* raw_output = cJSON_PrintUnformatted(root);
    std::string out = raw_output ? std::string(raw_output) : std::string("{}");
    free(raw_output);
    cJSON_Delete(root);
    return out;
}

std::string error_response(const std::string& message)
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "status", "error");
    cJSON_AddStringToObject(root, "message", message.c_str());
    return serialize(root);
}

/// Largest magnitude a JSON number (IEEE double) holds without rounding.
constexpr sqlite3_int64 kMaxExactInteger = sqlite3_int64(1) << 53;

cJSON* column_to_json(sqlite3_stmt* stmt, int col)
{
    switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_INTEGER: {
        sqlite3_int64 value = sqlite3_column_int64(stmt, col);
        if (value > kMaxExactInteger || value < -kMaxExactInteger) {
            return cJSON_CreateString(std::to_string(value).c_str());
        }
        return cJSON_CreateNumber(static_cast<double>(value));
    }
    case SQLITE_FLOAT:
        return cJSON_CreateNumber(sqlite3_column_double(stmt, col));
    case SQLITE_TEXT: {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return cJSON_CreateString(text ? reinterpret_cast<const char*>(text) : "");
    }
    case SQLITE_BLOB: {
        const void* data = sqlite3_column_blob(stmt, col);
        int size = sqlite3_column_bytes(stmt, col);
        std::string hex =
            infra::String::to_hex(static_cast<const uint8_t*>(data), static_cast<size_t>(size));
        return cJSON_CreateString(hex.c_str());
    }
    default:
        return cJSON_CreateNull();
    }
}

} // namespace

std::string Handler::execute(Session& session, const std::string& sql)
{
    sqlite3* db = session.handle();
    infra::Logger::log(infra::LogLevel::DEBUG, "Shell: Executing: " + sql);

    // 1. PREPARE PHASE
    sqlite3_stmt* raw_stmt = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size() + 1), &raw_stmt,
                                &tail);
    ScopedStatement stmt(raw_stmt);
    if (rc != SQLITE_OK) {
        return error_response(sqlite3_errmsg(db));
    }

    if (tail && !infra::String::trim(tail).empty()) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Shell: Ignoring trailing SQL: " + infra::String::trim(tail));
    }

    cJSON* resp_root = cJSON_CreateObject();
    cJSON* columns = cJSON_AddArrayToObject(resp_root, "columns");
    cJSON* rows = cJSON_AddArrayToObject(resp_root, "rows");

    // Blank input or a lone comment compiles to no statement at all.
    if (stmt.get() == nullptr) {
        cJSON_AddStringToObject(resp_root, "status", "ok");
        return serialize(resp_root);
    }

    int column_count = sqlite3_column_count(stmt.get());
    for (int i = 0; i < column_count; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        cJSON_AddItemToArray(columns, cJSON_CreateString(name ? name : ""));
    }

    // 2. STEP PHASE
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        cJSON* row = cJSON_CreateArray();
        for (int i = 0; i < column_count; ++i) {
            cJSON_AddItemToArray(row, column_to_json(stmt.get(), i));
        }
        cJSON_AddItemToArray(rows, row);
    }

    if (rc != SQLITE_DONE) {
        cJSON_Delete(resp_root);
        return error_response(sqlite3_errmsg(db));
    }

    // 3. RESPONSE PHASE
    cJSON_AddStringToObject(resp_root, "status", "ok");
    return serialize(resp_root);
}

} // namespace uuidkit::shell
