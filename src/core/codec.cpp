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
 * @file codec.cpp
 * @brief Implementation of the identifier codec.
 *
 * @details
 * Decoding is a single pass over the input with no allocation. Encoding
 * follows the 8-4-4-4-12 grouping of the canonical form.
 */

#include "uuidkit/core/codec.hpp"

#include "uuidkit/infra/string.hpp"

#include <iomanip>
#include <sstream>

namespace uuidkit::core {

namespace {

/// Visitor applied once to the incoming value.
struct Decoder {
    std::optional<Uuid> operator()(std::monostate) const
    {
        return std::nullopt;
    }

    std::optional<Uuid> operator()(std::string_view text) const
    {
        return Codec::parse(text);
    }

    std::optional<Uuid> operator()(const Blob& blob) const
    {
        if (blob.data == nullptr || blob.size != Uuid::kSize) {
            return std::nullopt;
        }
        return Uuid::from_raw(blob.data);
    }
};

bool is_hyphen_offset(size_t i)
{
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

std::optional<Uuid> Codec::decode(const Value& value)
{
    return std::visit(Decoder{}, value);
}

/**
 * Parsing strategy:
 * 1. Select the layout from the length alone (36 hyphenated, 32 plain).
 * 2. Walk the input once, requiring a hyphen at each group boundary of the
 * hyphenated layout and a hex digit everywhere else.
 * 3. Pack each pair of nibbles into the next output byte.
 */
std::optional<Uuid> Codec::parse(std::string_view text)
{
    const bool hyphenated = text.size() == kCanonicalLength;
    if (!hyphenated && text.size() != kSimpleLength) {
        return std::nullopt;
    }

    Bytes bytes{};
    size_t nibble = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (hyphenated && is_hyphen_offset(i)) {
            if (text[i] != '-') {
                return std::nullopt;
            }
            continue;
        }

        int v = infra::String::hex_value(text[i]);
        if (v < 0) {
            return std::nullopt;
        }

        uint8_t& out = bytes[nibble / 2];
        out = static_cast<uint8_t>((nibble % 2 == 0) ? (v << 4) : (out | v));
        ++nibble;
    }

    return Uuid(bytes);
}

std::string Codec::encode_text(const Uuid& id)
{
    const Bytes& b = id.bytes();

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < b.size(); ++i) {
        // Group boundaries of 8-4-4-4-12 fall before bytes 4, 6, 8 and 10.
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<unsigned>(b[i]);
    }
    return ss.str();
}

Bytes Codec::encode_buffer(const Uuid& id)
{
    return id.bytes();
}

} // namespace uuidkit::core
