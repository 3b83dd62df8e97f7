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
 * @file uuid.cpp
 * @brief Bit-field accessors for the `Uuid` value type.
 */

#include "uuidkit/core/uuid.hpp"

#include "uuidkit/core/codec.hpp"

#include <algorithm>

namespace uuidkit::core {

Uuid Uuid::from_raw(const uint8_t* data)
{
    Bytes bytes;
    std::copy(data, data + kSize, bytes.begin());
    return Uuid(bytes);
}

uint8_t Uuid::version() const
{
    return static_cast<uint8_t>(bytes_[6] >> 4);
}

uint8_t Uuid::variant_bits() const
{
    return static_cast<uint8_t>(bytes_[8] >> 6);
}

uint64_t Uuid::timestamp_ms() const
{
    uint64_t ms = 0;
    for (size_t i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes_[i];
    }
    return ms;
}

bool Uuid::is_nil() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::ostream& operator<<(std::ostream& os, const Uuid& id)
{
    return os << Codec::encode_text(id);
}

} // namespace uuidkit::core
