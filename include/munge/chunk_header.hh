/**
 * @file chunk_header.hh
 * @brief Chunk header structure and codec
 * @author Igor
 * @date 14/08/2025
 *
 * Every chunk starts with four tag bytes followed by the payload size as a
 * little endian u32. The size never includes the header itself.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <vector>

#include <munge/export_munge.h>
#include <munge/tag.hh>

namespace munge {

    /**
     * @struct chunk_header
     * @brief Header information for one chunk
     *
     * Plain value, freely copyable. The invariant
     * payload_offset + payload_size <= stream length holds for every header
     * produced by read_header().
     */
    struct chunk_header {
        static constexpr std::uint64_t header_size = 8;

        tag name;                          ///< Chunk tag (4 raw bytes)
        std::uint32_t payload_size = 0;    ///< Payload size in bytes
        std::uint64_t payload_offset = 0;  ///< Absolute offset of the first payload byte

        /// Absolute offset of the tag bytes
        [[nodiscard]] std::uint64_t header_offset() const { return payload_offset - header_size; }

        /// Absolute offset one past the last payload byte
        [[nodiscard]] std::uint64_t end_offset() const { return payload_offset + payload_size; }

        /// Header plus payload
        [[nodiscard]] std::uint64_t total_size() const { return header_size + payload_size; }
    };

    /**
     * @brief Read a header at the current stream position
     *
     * Leaves the stream at payload_offset.
     *
     * @throws io_error on a short read
     * @throws size_mismatch_error if the payload runs past the end of the stream
     */
    MUNGE_EXPORT chunk_header read_header(std::istream& stream);

    /**
     * @brief Write tag and size
     * @throws io_error if the stream fails
     */
    MUNGE_EXPORT void write_header(std::ostream& stream, const tag& name, std::uint32_t payload_size);

    /**
     * @brief Append tag and size to an in-memory buffer
     */
    MUNGE_EXPORT void append_header(std::vector<std::byte>& buffer, const tag& name, std::uint32_t payload_size);

} // namespace munge
