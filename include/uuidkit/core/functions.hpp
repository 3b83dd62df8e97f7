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
 * @file functions.hpp
 * @brief The SQL-visible UUID functions, expressed without any SQLite types.
 *
 * @details
 * Each method here is the body of one SQL function overload. The SQLite
 * adapter only marshals arguments in and results out; everything that
 * decides *what* the result is lives here, where it can be tested directly.
 *
 * | SQL call          | Method                    |
 * |-------------------|---------------------------|
 * | `uuid()`          | `uuid()`                  |
 * | `uuid_str(X)`     | `uuid_str(const Value&)`  |
 * | `uuid_blob()`     | `uuid_blob()`             |
 * | `uuid_blob(X)`    | `uuid_blob(const Value&)` |
 * | `uuid7()`         | `uuid7()`                 |
 * | `uuid7_blob()`    | `uuid7_blob()`            |
 * | `uuid7_blob(X)`   | `uuid7_blob(const Value&)`|
 *
 * The zero-argument forms always generate. The one-argument forms never do:
 * they decode their argument and re-encode it, returning an empty optional
 * (SQL `NULL`) when the argument is not an identifier, NULL included.
 */

#pragma once

#include "uuidkit/core/codec.hpp"
#include "uuidkit/core/uuid.hpp"

#include <optional>
#include <string>

namespace uuidkit::core {

/**
 * @class Functions
 * @brief Static implementations of the UUID SQL functions.
 */
class Functions {
  public:
    /// Fresh random identifier as canonical text.
    static std::string uuid();

    /// Canonical text of the decoded argument.
    static std::optional<std::string> uuid_str(const Value& arg);

    /// Fresh random identifier as a 16-byte buffer.
    static Bytes uuid_blob();

    /// 16-byte buffer of the decoded argument.
    static std::optional<Bytes> uuid_blob(const Value& arg);

    /// Fresh time-ordered identifier as canonical text.
    static std::string uuid7();

    /// Fresh time-ordered identifier as a 16-byte buffer.
    static Bytes uuid7_blob();

    /**
     * @brief 16-byte buffer of the decoded argument.
     *
     * Identical to `uuid_blob(const Value&)`: the argument is not required to
     * be a version 7 identifier.
     */
    static std::optional<Bytes> uuid7_blob(const Value& arg);
};

} // namespace uuidkit::core
