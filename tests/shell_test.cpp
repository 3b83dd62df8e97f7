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
 * @file shell_test.cpp
 * @brief Integration tests for the shell Session and Handler.
 *
 * @details
 * Responses are parsed back with cJSON so the tests check the document
 * structure rather than exact serialized text.
 */

#include "uuidkit/shell/handler.hpp"
#include "uuidkit/shell/session.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace {

/**
 * @brief Singleton in-memory session shared by the shell tests.
 */
uuidkit::shell::Session& get_shell_session()
{
    static uuidkit::shell::Session session(":memory:");
    return session;
}

std::string status_of(cJSON* resp)
{
    cJSON* status = cJSON_GetObjectItem(resp, "status");
    return (status && status->valuestring) ? status->valuestring : "";
}

} // namespace

/**
 * @brief A SELECT over the UUID functions yields columns and one row.
 */
void test_shell_select_row()
{
    auto& session = get_shell_session();
    std::string resp_str = uuidkit::shell::Handler::execute(
        session, "SELECT uuid_str(x'00000000000000000000000000000000') AS nil, "
                 "uuid_blob('12345678-1234-1234-1234-123456789abc') AS raw, 7 AS n, NULL AS z");

    cJSON* resp = cJSON_Parse(resp_str.c_str());
    ASSERT_NE(resp, (cJSON*)nullptr);

    if (status_of(resp) != "ok") {
        cJSON* msg = cJSON_GetObjectItem(resp, "message");
        if (msg)
            printf("    [DEBUG] Handler Rejection: %s\n", msg->valuestring);
    }
    ASSERT_EQ(status_of(resp), std::string("ok"));

    cJSON* columns = cJSON_GetObjectItem(resp, "columns");
    ASSERT_EQ(cJSON_GetArraySize(columns), 4);
    ASSERT_EQ(std::string(cJSON_GetArrayItem(columns, 0)->valuestring), std::string("nil"));

    cJSON* rows = cJSON_GetObjectItem(resp, "rows");
    ASSERT_EQ(cJSON_GetArraySize(rows), 1);

    cJSON* row = cJSON_GetArrayItem(rows, 0);
    ASSERT_EQ(std::string(cJSON_GetArrayItem(row, 0)->valuestring),
              std::string("00000000-0000-0000-0000-000000000000"));
    ASSERT_EQ(std::string(cJSON_GetArrayItem(row, 1)->valuestring),
              std::string("12345678123412341234123456789abc"));
    ASSERT_EQ(static_cast<int>(cJSON_GetArrayItem(row, 2)->valuedouble), 7);
    ASSERT_TRUE(cJSON_IsNull(cJSON_GetArrayItem(row, 3)) != 0);

    cJSON_Delete(resp);
}

/**
 * @brief Integers past ±2^53 keep every digit by travelling as strings.
 */
void test_shell_large_integer()
{
    auto& session = get_shell_session();
    std::string resp_str = uuidkit::shell::Handler::execute(
        session, "SELECT 9007199254740993 AS big, -9007199254740993 AS neg, "
                 "9007199254740992 AS edge, 7 AS small");

    cJSON* resp = cJSON_Parse(resp_str.c_str());
    ASSERT_NE(resp, (cJSON*)nullptr);
    ASSERT_EQ(status_of(resp), std::string("ok"));

    cJSON* row = cJSON_GetArrayItem(cJSON_GetObjectItem(resp, "rows"), 0);
    ASSERT_TRUE(cJSON_IsString(cJSON_GetArrayItem(row, 0)) != 0);
    ASSERT_EQ(std::string(cJSON_GetArrayItem(row, 0)->valuestring),
              std::string("9007199254740993"));
    ASSERT_EQ(std::string(cJSON_GetArrayItem(row, 1)->valuestring),
              std::string("-9007199254740993"));
    ASSERT_TRUE(cJSON_IsNumber(cJSON_GetArrayItem(row, 2)) != 0);
    ASSERT_TRUE(cJSON_IsNumber(cJSON_GetArrayItem(row, 3)) != 0);
    ASSERT_EQ(static_cast<int>(cJSON_GetArrayItem(row, 3)->valuedouble), 7);

    cJSON_Delete(resp);
}

/**
 * @brief Statements without a result set still return an ok document.
 */
void test_shell_ddl_and_insert()
{
    auto& session = get_shell_session();

    std::string created = uuidkit::shell::Handler::execute(
        session, "CREATE TABLE IF NOT EXISTS items(id BLOB PRIMARY KEY DEFAULT (uuid7_blob()), "
                 "name TEXT)");
    cJSON* resp = cJSON_Parse(created.c_str());
    ASSERT_NE(resp, (cJSON*)nullptr);
    ASSERT_EQ(status_of(resp), std::string("ok"));
    ASSERT_EQ(cJSON_GetArraySize(cJSON_GetObjectItem(resp, "rows")), 0);
    cJSON_Delete(resp);

    uuidkit::shell::Handler::execute(session, "INSERT INTO items(name) VALUES ('a'), ('b')");

    std::string listed = uuidkit::shell::Handler::execute(
        session, "SELECT uuid_str(id), name FROM items ORDER BY id");
    resp = cJSON_Parse(listed.c_str());
    ASSERT_NE(resp, (cJSON*)nullptr);
    ASSERT_EQ(status_of(resp), std::string("ok"));

    cJSON* rows = cJSON_GetObjectItem(resp, "rows");
    ASSERT_EQ(cJSON_GetArraySize(rows), 2);
    cJSON* first = cJSON_GetArrayItem(rows, 0);
    ASSERT_EQ(std::string(cJSON_GetArrayItem(first, 0)->valuestring).length(),
              static_cast<size_t>(36));
    ASSERT_EQ(std::string(cJSON_GetArrayItem(first, 1)->valuestring), std::string("a"));
    cJSON_Delete(resp);
}

/**
 * @brief SQL errors are reported as JSON error documents.
 */
void test_shell_sql_error()
{
    auto& session = get_shell_session();

    std::string resp_str = uuidkit::shell::Handler::execute(session, "SELEC uuid()");
    cJSON* resp = cJSON_Parse(resp_str.c_str());
    ASSERT_NE(resp, (cJSON*)nullptr);
    ASSERT_EQ(status_of(resp), std::string("error"));
    ASSERT_NE(cJSON_GetObjectItem(resp, "message"), (cJSON*)nullptr);
    cJSON_Delete(resp);

    resp_str = uuidkit::shell::Handler::execute(session, "SELECT uuid_str(1, 2)");
    resp = cJSON_Parse(resp_str.c_str());
    ASSERT_NE(resp, (cJSON*)nullptr);
    ASSERT_EQ(status_of(resp), std::string("error"));
    cJSON_Delete(resp);
}

/**
 * @brief A comment-only statement compiles to nothing and returns an empty ok.
 */
void test_shell_empty_statement()
{
    auto& session = get_shell_session();

    std::string resp_str = uuidkit::shell::Handler::execute(session, "-- nothing here");
    cJSON* resp = cJSON_Parse(resp_str.c_str());
    ASSERT_NE(resp, (cJSON*)nullptr);
    ASSERT_EQ(status_of(resp), std::string("ok"));
    ASSERT_EQ(cJSON_GetArraySize(cJSON_GetObjectItem(resp, "rows")), 0);
    cJSON_Delete(resp);
}

/**
 * @brief Opening a database in a missing directory throws.
 */
void test_shell_session_open_failure()
{
    bool threw = false;
    try {
        uuidkit::shell::Session bad("/nonexistent-uuidkit-dir/sub/db.sqlite");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}
