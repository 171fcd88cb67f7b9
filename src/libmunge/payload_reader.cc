//
// Created by igor on 14/08/2025.
//

#include "payload_reader.hh"
#include <munge/exceptions.hh>

#include <utility>
#include <algorithm>

namespace munge {

    payload_reader::payload_reader(std::unique_ptr<reader_base> reader, const chunk_header& header)
        : m_reader(std::move(reader))
        , m_start_offset(header.payload_offset)
        , m_size(header.payload_size)
        , m_bytes_read(0) {
        if (!m_reader) {
            THROW_PARSE("Invalid reader provided to payload_reader");
        }
    }

    payload_reader::~payload_reader() = default;

    std::size_t payload_reader::read(void* dst, std::size_t size) {
        if (!dst) {
            return 0;
        }

        // Limit read to remaining bytes in the payload
        std::uint64_t available = remaining();
        std::size_t to_read = static_cast<std::size_t>(std::min(static_cast<std::uint64_t>(size), available));

        if (to_read == 0) {
            return 0;
        }

        // Other readers may share the stream, so always reposition
        m_reader->seek(m_start_offset + m_bytes_read, reader_base::set);

        std::size_t bytes_read = m_reader->read(dst, to_read);
        m_bytes_read += bytes_read;

        return bytes_read;
    }

    bool payload_reader::skip(std::size_t size) {
        if (size > remaining()) {
            return false;
        }

        m_bytes_read += size;
        return true;
    }

    std::uint64_t payload_reader::offset() const {
        return m_bytes_read;
    }

    std::uint64_t payload_reader::remaining() const {
        return m_size - m_bytes_read;
    }

    std::unique_ptr<chunk_reader> open_payload(std::istream& stream, const chunk_header& header) {
        return std::make_unique<payload_reader>(std::make_unique<reader>(stream), header);
    }

} // namespace munge
