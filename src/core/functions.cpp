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
 * @file functions.cpp
 * @brief Composition of the generator and the codec into SQL function bodies.
 */

#include "uuidkit/core/functions.hpp"

#include "uuidkit/infra/id_generator.hpp"

namespace uuidkit::core {

namespace {

std::optional<Bytes> reencode_buffer(const Value& arg)
{
    auto id = Codec::decode(arg);
    if (!id) {
        return std::nullopt;
    }
    return Codec::encode_buffer(*id);
}

} // namespace

std::string Functions::uuid()
{
    return Codec::encode_text(infra::IdGenerator::generate_random());
}

std::optional<std::string> Functions::uuid_str(const Value& arg)
{
    auto id = Codec::decode(arg);
    if (!id) {
        return std::nullopt;
    }
    return Codec::encode_text(*id);
}

Bytes Functions::uuid_blob()
{
    return Codec::encode_buffer(infra::IdGenerator::generate_random());
}

std::optional<Bytes> Functions::uuid_blob(const Value& arg)
{
    return reencode_buffer(arg);
}

std::string Functions::uuid7()
{
    return Codec::encode_text(infra::IdGenerator::generate_ordered());
}

Bytes Functions::uuid7_blob()
{
    return Codec::encode_buffer(infra::IdGenerator::generate_ordered());
}

std::optional<Bytes> Functions::uuid7_blob(const Value& arg)
{
    return reencode_buffer(arg);
}

} // namespace uuidkit::core
