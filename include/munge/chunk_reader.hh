/**
 * @file chunk_reader.hh
 * @brief Bounded reader over one chunk payload
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <vector>
#include <cstdint>
#include <cstddef>

#include <munge/export_munge.h>
#include <munge/endian.hh>
#include <munge/chunk_header.hh>

namespace munge {

    /**
     * @class chunk_reader
     * @brief Abstract interface for reading chunk payload data
     *
     * Reads never leave the payload: requests past its end are cut short,
     * which read_exact() turns into an io_error.
     */
    class MUNGE_EXPORT chunk_reader {
    public:
        virtual ~chunk_reader() = default;

        /**
         * @brief Read data from the payload
         * @return Number of bytes actually read
         */
        virtual std::size_t read(void* dst, std::size_t size) = 0;

        /**
         * @brief Skip bytes in the payload
         * @return True if skip was successful
         */
        virtual bool skip(std::size_t size) = 0;

        virtual std::uint64_t remaining() const = 0;

        /// Current offset from payload start
        virtual std::uint64_t offset() const = 0;

        /// Payload size
        virtual std::uint64_t size() const = 0;

        /// Absolute stream offset of the read cursor, for diagnostics
        virtual std::uint64_t absolute_offset() const = 0;

        /**
         * @brief Read exactly size bytes
         * @throws io_error on a short read
         */
        void read_exact(void* dst, std::size_t size);

        /**
         * @brief Read one little endian scalar
         * @throws io_error on a short read
         */
        template<typename T>
        T read_le() {
            static_assert(is_packed_scalar_v<T>, "read_le only supports packed scalars");
            T value;
            read_exact(&value, sizeof(T));
            return to_little_endian(value);
        }

        /**
         * @brief Read all remaining data in the payload
         */
        virtual std::vector<std::byte> read_all();

        /**
         * @brief Read up to n bytes
         */
        virtual std::vector<std::byte> read_bytes(std::size_t n);
    };

    /**
     * @brief Open a reader positioned at the start of a chunk payload
     *
     * The reader keeps a reference to stream, which must outlive it.
     */
    MUNGE_EXPORT std::unique_ptr<chunk_reader> open_payload(std::istream& stream, const chunk_header& header);

} // namespace munge
