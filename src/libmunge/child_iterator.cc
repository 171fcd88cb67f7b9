//
// Created by igor on 13/08/2025.
//

#include <algorithm>
#include <array>
#include <cstring>
#include <istream>

#include <munge/child_iterator.hh>
#include <munge/endian.hh>
#include <munge/exceptions.hh>
#include "input.hh"

namespace munge {
    namespace {
        // Alignment slack seen between children in shipped files
        constexpr std::uint64_t max_padding = 3;
    }

    child_iterator::child_iterator(std::istream& stream, const chunk_header& parent, const parse_options& options)
        : m_reader(std::make_unique<reader>(stream)),
          m_parent(parent),
          m_options(options) {
        if (m_options.count_prefix) {
            read_count();
        }
        advance();
    }

    child_iterator::~child_iterator() = default;
    child_iterator::child_iterator(child_iterator&&) noexcept = default;
    child_iterator& child_iterator::operator=(child_iterator&&) noexcept = default;

    std::uint64_t child_iterator::skip_padding(std::uint64_t available) {
        const std::uint64_t start = m_parent.payload_offset + m_consumed;
        std::array<std::byte, max_padding> lead{};
        const auto want = static_cast<std::size_t>(std::min(available, max_padding));

        m_reader->seek(start, reader_base::set);
        const std::size_t got = m_reader->read(lead.data(), want);

        std::uint64_t zeros = 0;
        while (zeros < got && lead[zeros] == std::byte{0}) {
            zeros++;
        }
        if (zeros > 0) {
            m_options.warn(start, "padding",
                           build_error_msg("Skipping ", zeros, " padding byte(s) in ", m_parent.name));
        }
        return zeros;
    }

    void child_iterator::read_count() {
        THROW_SIZE_MISMATCH_IF(m_parent.payload_size < sizeof(std::uint32_t),
                               "Payload of ", m_parent.name, " at offset ", m_parent.header_offset(),
                               " is too small for a child count");

        std::uint32_t count;
        m_reader->seek(m_parent.payload_offset, reader_base::set);
        THROW_IO_IF(m_reader->read(&count, sizeof(count)) != sizeof(count),
                    "Cannot read child count of ", m_parent.name, " at offset ", m_parent.payload_offset);

        m_declared = swap32le(count);
        m_remaining = m_declared;
        m_consumed = sizeof(count);
    }

    void child_iterator::finish() {
        THROW_SIZE_MISMATCH_IF(m_options.count_prefix && m_remaining != 0,
                               "Parent ", m_parent.name, " at offset ", m_parent.header_offset(),
                               " declares ", m_declared, " children but holds only ",
                               m_declared - m_remaining);
        m_ended = true;
    }

    void child_iterator::advance() {
        if (m_consumed == m_parent.payload_size) {
            finish();
            return;
        }

        if (m_options.allow_padding) {
            m_consumed += skip_padding(m_parent.payload_size - m_consumed);
            if (m_consumed == m_parent.payload_size) {
                finish();
                return;
            }
        }

        const std::uint64_t available = m_parent.payload_size - m_consumed;
        const std::uint64_t child_offset = m_parent.payload_offset + m_consumed;

        THROW_SIZE_MISMATCH_IF(m_options.count_prefix && m_remaining == 0,
                               "Unknown data at offset ", child_offset, " after the ", m_declared,
                               " declared children of ", m_parent.name);

        THROW_SIZE_MISMATCH_IF(available < chunk_header::header_size,
                               "Children of ", m_parent.name, " at offset ", m_parent.header_offset(),
                               " end with ", available, " stray byte(s) at offset ", child_offset);

        m_reader->seek(child_offset, reader_base::set);
        chunk_header child = m_reader->read_header();

        THROW_SIZE_MISMATCH_IF(child.total_size() > available,
                               "Child ", child.name, " at offset ", child_offset, " needs ",
                               child.total_size(), " bytes but only ", available,
                               " remain in parent ", m_parent.name);

        m_current = child;
        m_consumed += child.total_size();
        if (m_options.count_prefix) {
            --m_remaining;
        }
    }

    std::vector<chunk_header> read_children(std::istream& stream, const chunk_header& parent,
                                            const parse_options& options) {
        std::vector<chunk_header> children;
        for (child_iterator it(stream, parent, options); it.has_next(); it.next()) {
            children.push_back(it.current());
        }
        return children;
    }

    bool looks_like_container(std::istream& stream, const chunk_header& h, const parse_options& options) {
        reader r(stream);
        std::uint64_t consumed = 0;
        std::uint64_t remaining = 0;

        if (options.count_prefix) {
            std::uint32_t count;
            if (h.payload_size < sizeof(count)) {
                return false;
            }
            r.seek(h.payload_offset, reader_base::set);
            if (r.read(&count, sizeof(count)) != sizeof(count)) {
                return false;
            }
            remaining = swap32le(count);
            consumed = sizeof(count);
        }

        if (h.payload_size - consumed < chunk_header::header_size) {
            return false;
        }

        while (consumed < h.payload_size) {
            const std::uint64_t available = h.payload_size - consumed;
            if (available < chunk_header::header_size) {
                return false;
            }
            if (options.count_prefix && remaining-- == 0) {
                return false;
            }

            std::array<char, chunk_header::header_size> raw{};
            r.seek(h.payload_offset + consumed, reader_base::set);
            if (r.read(raw.data(), raw.size()) != raw.size() || raw[0] == 0) {
                return false;
            }

            std::uint32_t size;
            std::memcpy(&size, raw.data() + 4, sizeof(size));
            const std::uint64_t total = chunk_header::header_size + swap32le(size);
            if (total > available) {
                return false;
            }
            consumed += total;
        }
        return !options.count_prefix || remaining == 0;
    }
}
