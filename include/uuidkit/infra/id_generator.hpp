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
 * @file id_generator.hpp
 * @brief Producers of fresh 128-bit identifiers.
 *
 * @details
 * This file declares the `IdGenerator` class, the source of every new
 * identifier handed out by the SQL functions. Two algorithms are offered:
 * RFC 9562 version 4 for unpredictable keys and version 7 for keys that sort
 * by creation time and therefore keep B-tree inserts append-mostly.
 */

#pragma once

#include "uuidkit/core/uuid.hpp"

#include <cstdint>

namespace uuidkit::infra {

/**
 * @class IdGenerator
 * @brief A static utility for generating version 4 and version 7 identifiers.
 *
 * @details
 * Both generators draw entropy from a per-thread `std::random_device`, so
 * concurrent callers never contend on a lock. Neither has a recoverable error
 * path: if the operating system cannot supply entropy the exception raised by
 * `std::random_device` propagates to the caller.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a random (version 4) identifier.
     *
     * Layout: `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`
     * - `x`: random hex digit.
     * - `4`: version nibble.
     * - `y`: variant, one of `{8, 9, a, b}`.
     *
     * @return core::Uuid 122 random bits plus the fixed version/variant tag.
     */
    static core::Uuid generate_random();

    /**
     * @brief Generates a time-ordered (version 7) identifier.
     *
     * Layout (big-endian):
     * | bits | field |
     * |---|---|
     * | 48 | Unix timestamp in milliseconds |
     * | 4  | version `0111` |
     * | 12 | clock sequence |
     * | 2  | variant `10` |
     * | 62 | random |
     *
     * Every value returned within one process is strictly greater than all
     * values returned before it, across all threads and regardless of wall
     * clock steps. The clock sequence restarts at a random 11-bit value each
     * new millisecond and increments for calls within the same millisecond;
     * on overflow it carries into the timestamp.
     *
     * @return core::Uuid A fresh, monotonically increasing identifier.
     */
    static core::Uuid generate_ordered();

    /**
     * @brief Current wall-clock time in milliseconds since the Unix epoch,
     * truncated to 48 bits.
     */
    static uint64_t now_ms();
};

} // namespace uuidkit::infra
