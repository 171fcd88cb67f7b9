/**
 * @file node_writer.hh
 * @brief Builds chunk trees in memory and emits them
 * @date 16/08/2025
 *
 * Each writer collects its own payload. A child is encoded into a nested
 * writer and appended to its parent as header plus payload once complete,
 * so sizes are always known when the header is produced and the output
 * stream never needs to seek.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <limits>
#include <utility>
#include <vector>

#include <munge/export_munge.h>
#include <munge/tag.hh>
#include <munge/chunk_name.hh>
#include <munge/packed.hh>

namespace munge {

    template<typename T, typename Enable = void>
    struct node_codec;

    class MUNGE_EXPORT node_writer {
    public:
        static constexpr std::uint64_t max_payload_size = std::numeric_limits<std::uint32_t>::max();

        /**
         * @param name Tag of the chunk being written
         * @param source Stream that deferred lazy payloads are copied from.
         *               Not owned, may be null.
         */
        explicit node_writer(const tag& name, std::istream* source = nullptr);

        [[nodiscard]] const tag& name() const { return m_name; }
        [[nodiscard]] std::istream* source() const { return m_source; }

        void write_raw(const void* data, std::size_t size);
        void write_bytes(const std::vector<std::byte>& bytes);

        template<typename T>
        void write_packed(const T& value) {
            packed_traits<T>::write(m_payload, value);
        }

        /**
         * @brief Encode value as a child chunk
         */
        template<typename T>
        void write_node(const chunk_name& name, const T& value) {
            node_writer child(resolve(name), m_source);
            node_codec<T>::encode(value, child);
            append_child(child);
        }

        /**
         * @brief Add a child whose payload fn writes by hand
         */
        template<typename F>
        void build_node(const chunk_name& name, F&& fn) {
            node_writer child(resolve(name), m_source);
            std::forward<F>(fn)(child);
            append_child(child);
        }

        /**
         * @brief Append a finished child writer
         * @throws size_mismatch_error if the child payload exceeds u32
         */
        void append_child(const node_writer& child);

        [[nodiscard]] const std::vector<std::byte>& payload() const { return m_payload; }
        [[nodiscard]] std::uint64_t payload_size() const { return m_payload.size(); }

        /**
         * @brief Header followed by payload
         * @throws size_mismatch_error if the payload exceeds u32
         */
        [[nodiscard]] std::vector<std::byte> finish() const;

        /**
         * @brief Emit header and payload to out
         * @throws size_mismatch_error if the payload exceeds u32
         * @throws io_error if the stream fails
         */
        void finish(std::ostream& out) const;

    private:
        [[nodiscard]] std::uint32_t checked_size() const;

        tag m_name;
        std::istream* m_source;
        std::vector<std::byte> m_payload;
    };

} // namespace munge
