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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure (IdGenerator, String, Logger).
 *
 * @details
 * The generator tests are statistical in nature: distinctness is asserted
 * for sample sizes where a collision of 122 (or 74) random bits is not a
 * realistic outcome.
 */

#include "uuidkit/core/codec.hpp"
#include "uuidkit/infra/id_generator.hpp"
#include "uuidkit/infra/logger.hpp"
#include "uuidkit/infra/string.hpp"
#include "framework.hpp"

#include <set>
#include <string>
#include <thread>
#include <vector>

using uuidkit::core::Codec;
using uuidkit::core::Uuid;
using uuidkit::infra::IdGenerator;

/**
 * @brief Version 4 identifiers carry the right tag and never repeat.
 */
void test_random_version_and_uniqueness()
{
    const size_t n = 1000;
    std::set<Uuid> seen;
    for (size_t i = 0; i < n; ++i) {
        Uuid id = IdGenerator::generate_random();
        ASSERT_EQ(static_cast<int>(id.version()), 4);
        ASSERT_EQ(static_cast<int>(id.variant_bits()), 2);
        seen.insert(id);
    }
    ASSERT_EQ(seen.size(), n);
}

/**
 * @brief Version 4 text has the canonical shape `xxxxxxxx-xxxx-4xxx-[89ab]xxx-xxxxxxxxxxxx`.
 */
void test_random_text_shape()
{
    std::string s = Codec::encode_text(IdGenerator::generate_random());
    ASSERT_EQ(s.length(), static_cast<size_t>(36));
    ASSERT_EQ(s[8], '-');
    ASSERT_EQ(s[13], '-');
    ASSERT_EQ(s[18], '-');
    ASSERT_EQ(s[23], '-');
    ASSERT_EQ(s[14], '4');
    ASSERT_TRUE(s[19] == '8' || s[19] == '9' || s[19] == 'a' || s[19] == 'b');
}

/**
 * @brief Version 7 identifiers embed the current Unix time in milliseconds.
 */
void test_ordered_version_and_timestamp()
{
    uint64_t before = IdGenerator::now_ms();
    Uuid id = IdGenerator::generate_ordered();
    uint64_t after = IdGenerator::now_ms();

    ASSERT_EQ(static_cast<int>(id.version()), 7);
    ASSERT_EQ(static_cast<int>(id.variant_bits()), 2);
    ASSERT_TRUE(id.timestamp_ms() >= before);
    // Sequence overflow in earlier bursts may run the field slightly ahead.
    ASSERT_TRUE(id.timestamp_ms() <= after + 100);
}

/**
 * @brief A tight loop yields strictly increasing, distinct identifiers.
 *
 * Ordering is checked both on the raw bytes and on the canonical text,
 * since text comparison is what most callers will do.
 */
void test_ordered_monotonic_tight_loop()
{
    const size_t n = 10000;
    Uuid prev = IdGenerator::generate_ordered();
    std::string prev_text = Codec::encode_text(prev);

    for (size_t i = 0; i < n; ++i) {
        Uuid next = IdGenerator::generate_ordered();
        std::string next_text = Codec::encode_text(next);
        ASSERT_EQ(static_cast<int>(next.version()), 7);
        ASSERT_TRUE(prev < next);
        ASSERT_TRUE(prev_text < next_text);
        prev = next;
        prev_text = next_text;
    }
}

/**
 * @brief Racing threads each see an increasing sequence and never collide.
 */
void test_ordered_monotonic_across_threads()
{
    const size_t thread_count = 4;
    const size_t per_thread = 2000;

    std::vector<std::vector<Uuid>> results(thread_count);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < thread_count; ++t) {
        workers.emplace_back([&results, t, per_thread] {
            results[t].reserve(per_thread);
            for (size_t i = 0; i < per_thread; ++i) {
                results[t].push_back(IdGenerator::generate_ordered());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::set<Uuid> all;
    for (const auto& seq : results) {
        for (size_t i = 1; i < seq.size(); ++i) {
            ASSERT_TRUE(seq[i - 1] < seq[i]);
        }
        all.insert(seq.begin(), seq.end());
    }
    ASSERT_EQ(all.size(), thread_count * per_thread);
}

/**
 * @brief Tests `String::trim` with padding on both sides.
 */
void test_string_trim()
{
    std::string clean = uuidkit::infra::String::trim("   SELECT uuid();\n");
    ASSERT_EQ(clean, std::string("SELECT uuid();"));
}

/**
 * @brief A whitespace-only string trims to empty.
 */
void test_string_trim_empty()
{
    std::string result = uuidkit::infra::String::trim("  \t\n  \r ");
    ASSERT_EQ(result, std::string(""));
    ASSERT_EQ(result.length(), static_cast<size_t>(0));
}

/**
 * @brief Hex digit parsing and byte rendering.
 */
void test_string_hex()
{
    using uuidkit::infra::String;

    ASSERT_EQ(String::hex_value('0'), 0);
    ASSERT_EQ(String::hex_value('9'), 9);
    ASSERT_EQ(String::hex_value('a'), 10);
    ASSERT_EQ(String::hex_value('F'), 15);
    ASSERT_EQ(String::hex_value('g'), -1);
    ASSERT_EQ(String::hex_value('-'), -1);

    const uint8_t bytes[] = {0x00, 0x0f, 0xa5, 0xff};
    ASSERT_EQ(String::to_hex(bytes, sizeof(bytes)), std::string("000fa5ff"));
    ASSERT_EQ(String::to_hex(nullptr, 0), std::string(""));

    ASSERT_TRUE(String::starts_with("-- comment", "--"));
    ASSERT_FALSE(String::starts_with("-", "--"));
}

/**
 * @brief Level names parse case-insensitively; unknown names are rejected.
 */
void test_log_level_parse()
{
    using uuidkit::infra::Logger;
    using uuidkit::infra::LogLevel;

    ASSERT_TRUE(Logger::parse_level("debug") == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level("WARN") == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("Fatal") == LogLevel::FATAL);
    ASSERT_FALSE(Logger::parse_level("verbose").has_value());

    LogLevel saved = Logger::level();
    Logger::set_level(LogLevel::ERROR);
    ASSERT_TRUE(Logger::level() == LogLevel::ERROR);
    Logger::set_level(saved);
}
