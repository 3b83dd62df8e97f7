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
 * @file string.cpp
 * @brief Implementation of the text helpers.
 */

#include "uuidkit/infra/string.hpp"

#include <cctype>

namespace uuidkit::infra {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

bool is_space(char c)
{
    // The cast keeps std::isspace defined for bytes above 0x7F.
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

/**
 * Scans inwards from both ends and copies the remaining range once.
 */
std::string String::trim(std::string_view s)
{
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) {
        start++;
    }

    if (start == s.size()) {
        return "";
    }

    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) {
        end--;
    }

    return std::string(s.substr(start, end - start));
}

bool String::starts_with(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

int String::hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string String::to_hex(const uint8_t* data, size_t size)
{
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

} // namespace uuidkit::infra
