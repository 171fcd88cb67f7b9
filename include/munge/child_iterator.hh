/**
 * @file child_iterator.hh
 * @brief Enumeration of the direct children of a chunk
 * @author Igor
 * @date 13/08/2025
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <vector>
#include <cstdint>

#include <munge/export_munge.h>
#include <munge/chunk_header.hh>
#include <munge/parse_options.hh>

namespace munge {

    class reader_base;

    /**
     * @class child_iterator
     * @brief Walks the children packed back to back in a parent payload
     *
     * Holds only the parent header and a cursor. Each child accounts for
     * 8 + payload_size bytes, and iteration ends when the running total
     * equals the parent's payload_size exactly.
     *
     * With parse_options::count_prefix the payload starts with a u32 child
     * count, and exactly that many children must follow.
     *
     * @throws size_mismatch_error when a child overruns the parent, a
     *         partial header is left at the end of the parent, or the
     *         children disagree with the declared count
     */
    class MUNGE_EXPORT child_iterator {
    public:
        child_iterator(std::istream& stream, const chunk_header& parent, const parse_options& options = {});
        ~child_iterator();

        child_iterator(child_iterator&&) noexcept;
        child_iterator& operator=(child_iterator&&) noexcept;

        child_iterator(const child_iterator&) = delete;
        child_iterator& operator=(const child_iterator&) = delete;

        [[nodiscard]] const chunk_header& current() const { return m_current; }
        [[nodiscard]] const chunk_header& parent() const { return m_parent; }

        void next() {
            advance();
        }

        [[nodiscard]] bool has_next() const { return !m_ended; }
        [[nodiscard]] bool at_end() const { return m_ended; }

        /// Parent payload bytes accounted for so far
        [[nodiscard]] std::uint64_t consumed() const { return m_consumed; }

    private:
        void read_count();
        void advance();
        void finish();
        std::uint64_t skip_padding(std::uint64_t available);

        std::unique_ptr<reader_base> m_reader;
        chunk_header m_parent;
        chunk_header m_current;
        parse_options m_options;
        std::uint64_t m_consumed = 0;
        std::uint32_t m_declared = 0;
        std::uint32_t m_remaining = 0;
        bool m_ended = false;
    };

    /**
     * @brief All direct children of parent, in stream order
     */
    MUNGE_EXPORT std::vector<chunk_header> read_children(std::istream& stream,
                                                        const chunk_header& parent,
                                                        const parse_options& options = {});

    /**
     * @brief Check whether the payload of h splits exactly into child chunks
     *
     * Leaf payloads carry no marker, so this is a structural guess: every
     * child must start with a non-zero byte and the sizes must add up to the
     * parent's payload size. With options.count_prefix the payload must
     * start with a child count that matches. Never throws on malformed data.
     */
    MUNGE_EXPORT bool looks_like_container(std::istream& stream, const chunk_header& h,
                                           const parse_options& options = {});

} // namespace munge
