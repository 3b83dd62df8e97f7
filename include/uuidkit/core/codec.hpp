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
 * @file codec.hpp
 * @brief Conversion between dynamic host values and the `Uuid` value type.
 *
 * @details
 * The codec is the only place where a caller-supplied value is interpreted as
 * an identifier. It accepts two encodings on the way in (text and a raw
 * 16-byte buffer) and produces two on the way out (canonical text and the raw
 * buffer). Malformed input is reported as an empty `std::optional`, never as
 * an exception: the SQL layer maps that absence straight to `NULL`.
 */

#pragma once

#include "uuidkit/core/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace uuidkit::core {

/**
 * @struct Blob
 * @brief Non-owning view over a byte buffer supplied by the host engine.
 */
struct Blob {
    const uint8_t* data = nullptr;
    size_t size = 0;
};

/**
 * @brief A dynamically-typed scalar as handed over by the host engine.
 *
 * - `std::monostate`: NULL, a numeric value, or a missing argument.
 * - `std::string_view`: a TEXT value.
 * - `Blob`: a BLOB value.
 *
 * The views borrow host memory and are valid only for the duration of the
 * call that produced them.
 */
using Value = std::variant<std::monostate, std::string_view, Blob>;

/**
 * @class Codec
 * @brief Stateless decoder/encoder for identifier representations.
 */
class Codec {
  public:
    /// Length of the hyphenated canonical text form.
    static constexpr size_t kCanonicalLength = 36;

    /// Length of the plain 32-digit hex form (accepted on decode only).
    static constexpr size_t kSimpleLength = 32;

    /**
     * @brief Interprets a dynamic value as an identifier.
     *
     * **Accepted shapes:**
     * - TEXT of 36 characters with hyphens at offsets 8, 13, 18 and 23.
     * - TEXT of 32 hex characters without hyphens.
     * - BLOB of exactly 16 bytes.
     *
     * Hex digits are case-insensitive. Anything else, including NULL and
     * numeric values, yields `std::nullopt`.
     *
     * @param value The host value to inspect.
     * @return std::optional<Uuid> The decoded identifier, or empty.
     */
    static std::optional<Uuid> decode(const Value& value);

    /**
     * @brief Parses the textual half of `decode`.
     *
     * @param text Candidate identifier text.
     * @return std::optional<Uuid> The parsed identifier, or empty when `text`
     * is not one of the two accepted textual forms.
     */
    static std::optional<Uuid> parse(std::string_view text);

    /**
     * @brief Renders the canonical text form.
     *
     * @return std::string Exactly 36 characters, lowercase, zero padded,
     * e.g. `"0190a1b2-c3d4-7e5f-8a6b-7c8d9e0f1a2b"`.
     */
    static std::string encode_text(const Uuid& id);

    /**
     * @brief Renders the raw buffer form.
     *
     * @return Bytes The 16 big-endian bytes of the identifier.
     */
    static Bytes encode_buffer(const Uuid& id);
};

} // namespace uuidkit::core
