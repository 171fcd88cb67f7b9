//
// Created by igor on 14/08/2025.
//

#pragma once

#include <memory>

#include <munge/chunk_reader.hh>
#include "input.hh"

namespace munge {

    class payload_reader : public chunk_reader {
    public:
        payload_reader(std::unique_ptr<reader_base> reader, const chunk_header& header);
        ~payload_reader() override;

        // Core operations
        std::size_t read(void* dst, std::size_t size) override;
        bool skip(std::size_t size) override;

        // Status queries
        std::uint64_t remaining() const override;
        std::uint64_t offset() const override;
        std::uint64_t size() const override { return m_size; }
        std::uint64_t absolute_offset() const override { return m_start_offset + m_bytes_read; }

    private:
        std::unique_ptr<reader_base> m_reader;
        std::uint64_t m_start_offset;  // Offset where the payload starts in the stream
        std::uint64_t m_size;          // Payload size
        std::uint64_t m_bytes_read;    // Bytes read so far
    };

} // namespace munge
