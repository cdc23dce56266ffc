#pragma once

/**
 * @file serializer.hpp
 * @brief Binary serialization for version vectors (storage and transmission)
 *
 * WHY THIS FILE EXISTS:
 * Every SyncOperation carries a version vector, and operations travel between
 * replicas and sit in storage. The vector needs a compact, canonical byte
 * form that any replica decodes the same way.
 *
 * BINARY FORMAT (all integers little-endian):
 * [count: 4 bytes]
 * For each entry, sorted by replica id ascending:
 *   [id_length: 2 bytes] [id: id_length bytes, UTF-8]
 *   [counter: 8 bytes, signed]
 *
 * EXAMPLE:
 * {"d1": 3}  ->  01 00 00 00 | 02 00 | 'd' '1' | 03 00 00 00 00 00 00 00
 *
 * DESIGN DECISIONS:
 * - Little-endian written byte by byte, so the output does not depend on
 *   the host byte order
 * - Entries sorted, so equal vectors always produce equal bytes
 * - Decoding checks bounds before every read and rejects the whole buffer
 *   on the first problem; a partially decoded vector is never returned
 */

#include "synccore/clock/version_vector.hpp"
#include "synccore/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace synccore::clock {

/**
 * @brief Stateless encoder/decoder for the version vector wire format
 */
class Serializer {
public:
    static constexpr std::size_t kMaxReplicaIdLength = std::numeric_limits<std::uint16_t>::max();

    /**
     * Serialize a version vector
     *
     * Fails only when a replica id does not fit the 2-byte length prefix
     * or the entry count does not fit 4 bytes.
     */
    static Result<std::vector<std::uint8_t>> serialize(const VersionVector& vector) {
        const auto& counters = vector.to_mapping();
        if (counters.size() > std::numeric_limits<std::uint32_t>::max()) {
            return Err<std::vector<std::uint8_t>>(
                Error{ErrorCode::DataFormat, "Too many version vector entries"});
        }

        std::vector<std::uint8_t> buffer;
        buffer.reserve(4 + counters.size() * 16);

        write_uint32(buffer, static_cast<std::uint32_t>(counters.size()));

        // std::map iterates in ascending key order
        for (const auto& [replica_id, counter] : counters) {
            if (replica_id.size() > kMaxReplicaIdLength) {
                return Err<std::vector<std::uint8_t>>(
                    Error{ErrorCode::DataFormat, "Replica id too long: " + std::to_string(replica_id.size()) + " bytes"});
            }
            write_uint16(buffer, static_cast<std::uint16_t>(replica_id.size()));
            buffer.insert(buffer.end(), replica_id.begin(), replica_id.end());
            write_int64(buffer, counter);
        }

        return Ok(std::move(buffer));
    }

    /**
     * Deserialize a version vector
     *
     * ERROR HANDLING:
     * DataFormat error when the buffer is truncated, a length prefix points
     * past the end, a counter is negative, ids are not strictly ascending, or
     * bytes remain after the last entry.
     */
    static Result<VersionVector> deserialize(const std::vector<std::uint8_t>& data) {
        std::size_t cursor = 0;

        auto count_result = read_uint32(data, cursor);
        if (count_result.is_error()) {
            return Err<VersionVector>(count_result.error());
        }
        const std::uint32_t count = count_result.value();

        // Each entry needs at least 10 bytes; reject absurd counts before looping
        if (static_cast<std::uint64_t>(count) * 10 > data.size() - cursor) {
            return Err<VersionVector>(
                Error{ErrorCode::DataFormat, "Entry count " + std::to_string(count) + " exceeds buffer size"});
        }

        CounterMap counters;
        for (std::uint32_t i = 0; i < count; ++i) {
            auto id_result = read_string(data, cursor);
            if (id_result.is_error()) {
                return Err<VersionVector>(id_result.error());
            }

            auto counter_result = read_int64(data, cursor);
            if (counter_result.is_error()) {
                return Err<VersionVector>(counter_result.error());
            }
            if (counter_result.value() < 0) {
                return Err<VersionVector>(
                    Error{ErrorCode::DataFormat, "Negative counter for replica " + id_result.value()});
            }

            if (!counters.empty() && !(counters.rbegin()->first < id_result.value())) {
                return Err<VersionVector>(
                    Error{ErrorCode::DataFormat, "Replica ids not strictly ascending at entry " + std::to_string(i)});
            }
            counters.emplace_hint(counters.end(), std::move(id_result.value()), counter_result.value());
        }

        if (cursor != data.size()) {
            return Err<VersionVector>(
                Error{ErrorCode::DataFormat, std::to_string(data.size() - cursor) + " trailing bytes after version vector"});
        }

        return VersionVector::from_mapping(std::move(counters));
    }

private:
    static void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
        buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    }

    static void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
        }
    }

    static void write_int64(std::vector<std::uint8_t>& buffer, std::int64_t value) {
        const auto bits = static_cast<std::uint64_t>(value);
        for (int shift = 0; shift < 64; shift += 8) {
            buffer.push_back(static_cast<std::uint8_t>((bits >> shift) & 0xFF));
        }
    }

    static Result<std::uint16_t> read_uint16(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
        if (buffer.size() < 2 || cursor > buffer.size() - 2) {
            return Err<std::uint16_t>(Error{ErrorCode::DataFormat, "Buffer underflow reading uint16"});
        }
        const auto value = static_cast<std::uint16_t>(buffer[cursor] | (buffer[cursor + 1] << 8));
        cursor += 2;
        return Ok(value);
    }

    static Result<std::uint32_t> read_uint32(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
        if (buffer.size() < 4 || cursor > buffer.size() - 4) {
            return Err<std::uint32_t>(Error{ErrorCode::DataFormat, "Buffer underflow reading uint32"});
        }
        std::uint32_t value = 0;
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | buffer[cursor + static_cast<std::size_t>(i)];
        }
        cursor += 4;
        return Ok(value);
    }

    static Result<std::int64_t> read_int64(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
        if (buffer.size() < 8 || cursor > buffer.size() - 8) {
            return Err<std::int64_t>(Error{ErrorCode::DataFormat, "Buffer underflow reading int64"});
        }
        std::uint64_t bits = 0;
        for (int i = 7; i >= 0; --i) {
            bits = (bits << 8) | buffer[cursor + static_cast<std::size_t>(i)];
        }
        cursor += 8;
        return Ok(static_cast<std::int64_t>(bits));
    }

    static Result<std::string> read_string(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
        auto length_result = read_uint16(buffer, cursor);
        if (length_result.is_error()) {
            return Err<std::string>(length_result.error());
        }
        const std::size_t length = length_result.value();

        if (length > buffer.size() - cursor) {
            return Err<std::string>(Error{ErrorCode::DataFormat, "Buffer underflow reading replica id"});
        }

        std::string value(buffer.begin() + static_cast<std::ptrdiff_t>(cursor),
                          buffer.begin() + static_cast<std::ptrdiff_t>(cursor + length));
        cursor += length;
        return Ok(std::move(value));
    }
};

} // namespace synccore::clock
