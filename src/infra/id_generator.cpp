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
 * @file id_generator.cpp
 * @brief Implementation of the version 4 and version 7 generators.
 *
 * @details
 * Bit layouts follow RFC 9562. The version 7 generator keeps one process-wide
 * atomic word holding the last issued `(timestamp << 12) | sequence`, which is
 * what makes its output strictly increasing without a mutex.
 */

#include "uuidkit/infra/id_generator.hpp"

#include <atomic>
#include <chrono>
#include <random>

namespace uuidkit::infra {

namespace {

constexpr uint64_t kTimestampMask = 0xFFFFFFFFFFFFULL; // 48 bits
constexpr uint64_t kSequenceBits = 12;
constexpr uint64_t kSequenceSeedMask = 0x7FF; // 11 bits, top bit clear

/// Last issued (timestamp << 12 | sequence) for version 7 identifiers.
std::atomic<uint64_t> g_last_ordered{0};

/**
 * @brief Draws 64 bits from this thread's entropy source.
 *
 * `std::random_device` is read directly rather than used to seed a PRNG, so
 * every random bit in an identifier comes from the operating system.
 */
uint64_t next_random()
{
    static thread_local std::random_device rd;
    static thread_local std::uniform_int_distribution<uint64_t> dis;
    return dis(rd);
}

/// Writes the low `count` bytes of `value` big-endian at `bytes[offset]`.
void store_be(core::Bytes& bytes, size_t offset, uint64_t value, size_t count)
{
    for (size_t i = 0; i < count; ++i) {
        bytes[offset + count - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

} // namespace

uint64_t IdGenerator::now_ms()
{
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
    return static_cast<uint64_t>(ms) & kTimestampMask;
}

/**
 * Implementation Strategy:
 * 1. Fill all 16 bytes from two 64-bit entropy samples.
 * 2. Force the high nibble of byte 6 to `0100` (version 4).
 * 3. Force the top two bits of byte 8 to `10` (RFC variant).
 */
core::Uuid IdGenerator::generate_random()
{
    core::Bytes bytes;
    store_be(bytes, 0, next_random(), 8);
    store_be(bytes, 8, next_random(), 8);

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    return core::Uuid(bytes);
}

/**
 * Implementation Strategy:
 * 1. **Reserve**: advance the shared clock word with a compare-exchange loop.
 * A newer millisecond resets the sequence to a random seed; otherwise the
 * word is incremented, so the reserved value is always above every earlier one.
 * 2. **Layout**: timestamp into bytes 0-5, version and sequence into bytes 6-7.
 * 3. **Fill**: 62 random bits behind the variant bits in bytes 8-15.
 */
core::Uuid IdGenerator::generate_ordered()
{
    const uint64_t now = now_ms();

    uint64_t prev = g_last_ordered.load(std::memory_order_relaxed);
    uint64_t next = 0;
    do {
        if (now > (prev >> kSequenceBits)) {
            next = (now << kSequenceBits) | (next_random() & kSequenceSeedMask);
        } else {
            // Same (or earlier) millisecond: count upwards from the last value.
            next = prev + 1;
        }
    } while (!g_last_ordered.compare_exchange_weak(prev, next, std::memory_order_acq_rel,
                                                   std::memory_order_relaxed));

    const uint64_t timestamp = (next >> kSequenceBits) & kTimestampMask;
    const uint64_t sequence = next & ((1ULL << kSequenceBits) - 1);

    core::Bytes bytes;
    store_be(bytes, 0, timestamp, 6);
    bytes[6] = static_cast<uint8_t>(0x70 | (sequence >> 8));
    bytes[7] = static_cast<uint8_t>(sequence & 0xFF);

    store_be(bytes, 8, next_random(), 8);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    return core::Uuid(bytes);
}

} // namespace uuidkit::infra
