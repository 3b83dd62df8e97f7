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
 * @file string.hpp
 * @brief Character and text helpers shared by the codec and the shell.
 *
 * @details
 * Small stateless routines that the standard library does not offer directly:
 * whitespace trimming for shell input, and the hex digit conversions used by
 * the identifier codec and by the shell's BLOB rendering.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uuidkit::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace.
     *
     * Whitespace is whatever `std::isspace` accepts in the "C" locale
     * (space, `\t`, `\n`, `\r`, `\v`, `\f`).
     *
     * @param s The source text.
     * @return std::string The trimmed copy; empty if `s` is all whitespace.
     *
     * @code
     * std::string sql = uuidkit::infra::String::trim("  SELECT uuid();\n"); // "SELECT uuid();"
     * @endcode
     */
    static std::string trim(std::string_view s);

    /**
     * @brief Returns true when `s` begins with `prefix`.
     */
    static bool starts_with(std::string_view s, std::string_view prefix);

    /**
     * @brief Converts one hexadecimal digit to its value.
     *
     * @param c A character in `[0-9a-fA-F]`.
     * @return int The value 0..15, or -1 if `c` is not a hex digit.
     */
    static int hex_value(char c);

    /**
     * @brief Renders a byte buffer as lowercase hex, two digits per byte.
     *
     * @param data Start of the buffer. May be null when `size` is zero.
     * @param size Number of bytes.
     */
    static std::string to_hex(const uint8_t* data, size_t size);
};

} // namespace uuidkit::infra
