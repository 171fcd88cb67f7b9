//
// Created by igor on 16/08/2025.
//

#include <ostream>

#include <munge/node_writer.hh>
#include <munge/chunk_header.hh>
#include <munge/exceptions.hh>

namespace munge {

    node_writer::node_writer(const tag& name, std::istream* source)
        : m_name(name),
          m_source(source) {
    }

    void node_writer::write_raw(const void* data, std::size_t size) {
        append_raw(m_payload, data, size);
    }

    void node_writer::write_bytes(const std::vector<std::byte>& bytes) {
        m_payload.insert(m_payload.end(), bytes.begin(), bytes.end());
    }

    std::uint32_t node_writer::checked_size() const {
        THROW_SIZE_MISMATCH_IF(payload_size() > max_payload_size,
                               "Payload of chunk ", m_name, " is ", payload_size(),
                               " bytes, more than a chunk header can describe");
        return static_cast<std::uint32_t>(payload_size());
    }

    void node_writer::append_child(const node_writer& child) {
        append_header(m_payload, child.m_name, child.checked_size());
        m_payload.insert(m_payload.end(), child.m_payload.begin(), child.m_payload.end());
    }

    std::vector<std::byte> node_writer::finish() const {
        std::vector<std::byte> out;
        out.reserve(chunk_header::header_size + m_payload.size());
        append_header(out, m_name, checked_size());
        out.insert(out.end(), m_payload.begin(), m_payload.end());
        return out;
    }

    void node_writer::finish(std::ostream& out) const {
        write_header(out, m_name, checked_size());
        out.write(reinterpret_cast<const char*>(m_payload.data()), static_cast<std::streamsize>(m_payload.size()));
        THROW_IO_UNLESS(out.good(), "Failed to write payload of chunk ", m_name);
    }

} // namespace munge
