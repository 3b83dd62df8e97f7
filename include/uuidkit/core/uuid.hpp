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
 * @file uuid.hpp
 * @brief The 128-bit identifier value type shared by every UuidKit layer.
 *
 * @details
 * `Uuid` is a plain value: sixteen bytes in network (big-endian) order, copied
 * freely and never shared by reference. It carries no knowledge of how it was
 * produced; the version and variant accessors simply read the bits that
 * RFC 9562 assigns to them.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>

namespace uuidkit::core {

/// Raw 16-byte representation of an identifier.
using Bytes = std::array<uint8_t, 16>;

/**
 * @class Uuid
 * @brief An immutable 128-bit identifier stored as big-endian bytes.
 *
 * @details
 * Comparison operators compare the byte sequence lexicographically as
 * unsigned values, which is the same as comparing the two 128-bit integers.
 * Time-ordered identifiers therefore sort by creation time under `<`.
 */
class Uuid {
  public:
    /// Number of bytes in the raw encoding.
    static constexpr size_t kSize = 16;

    /// Constructs the nil identifier (all zero bits).
    Uuid() : bytes_{} {}

    /// Wraps an existing big-endian byte array.
    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Builds an identifier from a raw buffer of exactly `kSize` bytes.
     *
     * @param data Pointer to the first byte. Must reference 16 readable bytes.
     * @return Uuid The identifier holding a copy of those bytes.
     */
    static Uuid from_raw(const uint8_t* data);

    /// Read-only access to the big-endian byte array.
    const Bytes& bytes() const
    {
        return bytes_;
    }

    /**
     * @brief Returns the version field (high nibble of byte 6).
     *
     * `4` for random identifiers, `7` for time-ordered ones. Identifiers that
     * entered through the codec may carry any value.
     */
    uint8_t version() const;

    /**
     * @brief Returns the two most significant bits of byte 8.
     *
     * RFC 9562 identifiers carry `0b10` here.
     */
    uint8_t variant_bits() const;

    /**
     * @brief Extracts the 48-bit millisecond timestamp of a time-ordered identifier.
     *
     * Meaningful only when `version() == 7`; for other versions the result is
     * whatever occupies the top 48 bits.
     */
    uint64_t timestamp_ms() const;

    /// True when all 128 bits are zero.
    bool is_nil() const;

    friend bool operator==(const Uuid& a, const Uuid& b)
    {
        return a.bytes_ == b.bytes_;
    }
    friend bool operator!=(const Uuid& a, const Uuid& b)
    {
        return a.bytes_ != b.bytes_;
    }
    friend bool operator<(const Uuid& a, const Uuid& b)
    {
        return a.bytes_ < b.bytes_;
    }
    friend bool operator>(const Uuid& a, const Uuid& b)
    {
        return b < a;
    }
    friend bool operator<=(const Uuid& a, const Uuid& b)
    {
        return !(b < a);
    }
    friend bool operator>=(const Uuid& a, const Uuid& b)
    {
        return !(a < b);
    }

  private:
    Bytes bytes_;
};

/// Writes the canonical 36-character text form.
std::ostream& operator<<(std::ostream& os, const Uuid& id);

} // namespace uuidkit::core
