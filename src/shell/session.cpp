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
 * @file session.cpp
 * @brief Connection lifecycle for the UuidKit shell.
 */

#include "uuidkit/shell/session.hpp"

#include "uuidkit/ffi/sqlite_adapter.hpp"
#include "uuidkit/infra/logger.hpp"

#include <stdexcept>
#include <utility>

namespace uuidkit::shell {

/**
 * **Startup Sequence:**
 * 1. Open the database (read-write, create if missing).
 * 2. Install the UUID functions on the new connection.
 *
 * On failure of either step the half-open connection is closed before the
 * exception leaves the constructor, since the destructor will not run.
 */
Session::Session(std::string path) : path_(std::move(path))
{
    int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open database '" + path_ + "': " + reason);
    }

    char* err = nullptr;
    rc = sqlite3_uuid_init(db_, &err, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot load UUID functions: " + reason);
    }

    infra::Logger::log(infra::LogLevel::INFO, "Shell: Session opened on '" + path_ + "'");
}

Session::~Session()
{
    if (db_) {
        // sqlite3_close_v2 defers the close if a statement was leaked.
        sqlite3_close_v2(db_);
        infra::Logger::log(infra::LogLevel::INFO, "Shell: Session on '" + path_ + "' closed");
    }
}

} // namespace uuidkit::shell
