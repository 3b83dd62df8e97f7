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
 * @file handler.hpp
 * @brief Statement executor that reports results as JSON.
 *
 * @details
 * Declares the `Handler` class used by the shell to run one SQL statement
 * against a `Session` and serialize everything it produced, rows or error,
 * into a single JSON document.
 */

#pragma once

#include "uuidkit/shell/session.hpp"

#include <string>

namespace uuidkit::shell {

/**
 * @class Handler
 * @brief A static executor translating SQL results into JSON responses.
 */
class Handler {
  public:
    /**
     * @brief Prepares, steps and finalizes one SQL statement.
     *
     * Only the first statement of `sql` runs; any trailing text is ignored
     * with a warning in the log.
     *
     * @param session The connection to execute on.
     * @param sql The statement text.
     *
     * @return std::string A compact JSON document.
     *
     * **Response Formats:**
     * - **Success:** `{"status":"ok","columns":["c1",...],"rows":[[v1,...],...]}`
     * - **Error:** `{"status":"error","message":"<sqlite error>"}`
     *
     * **Value Mapping:** TEXT to string, INTEGER and FLOAT to number,
     * NULL to `null`, BLOB to a lowercase hex string. An INTEGER outside
     * ±2^53 becomes a decimal string, since a JSON number would round it.
     *
     * @code
     * // {"status":"ok","columns":["uuid_str(x'00000000000000000000000000000000')"],
     * //  "rows":[["00000000-0000-0000-0000-000000000000"]]}
     * Handler::execute(session, "SELECT uuid_str(x'00000000000000000000000000000000')");
     * @endcode
     */
    static std::string execute(Session& session, const std::string& sql);
};

} // namespace uuidkit::shell
