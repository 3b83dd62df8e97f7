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
 * @file session.hpp
 * @brief Owned SQLite connection with the UUID functions installed.
 */

#pragma once

#include <sqlite3.h>
#include <string>

namespace uuidkit::shell {

/**
 * @class Session
 * @brief RAII owner of one SQLite connection.
 *
 * @details
 * Construction opens (or creates) the database and registers the UUID
 * functions on it through `sqlite3_uuid_init`; destruction closes the
 * connection. A `Session` that exists is always usable.
 */
class Session {
  public:
    /**
     * @brief Opens `path` and installs the extension.
     *
     * @param path Database file, or `":memory:"` for a private in-memory database.
     * @throws std::runtime_error If the database cannot be opened or the
     * functions cannot be registered. The message carries SQLite's reason.
     */
    explicit Session(std::string path = ":memory:");

    /// Closes the connection.
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Borrowed connection handle, valid for the lifetime of the session.
    sqlite3* handle() const
    {
        return db_;
    }

    /// The path the session was opened with.
    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
    sqlite3* db_ = nullptr;
};

} // namespace uuidkit::shell
