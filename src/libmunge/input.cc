//
// Created by igor on 12/08/2025.
//

#include <array>
#include <cstring>
#include <istream>
#include <string>

#include <munge/endian.hh>
#include "input.hh"

namespace munge {
    chunk_header reader_base::read_header() {
        const std::uint64_t header_offset = tell();

        std::array<char, chunk_header::header_size> raw{};
        std::size_t actual = read(raw.data(), raw.size());
        THROW_IO_IF(actual != raw.size(), "Truncated chunk header at offset ", header_offset,
                    ": got ", actual, " of ", raw.size(), " bytes");

        chunk_header h;
        h.name = tag::from_bytes(raw.data());
        std::uint32_t size;
        std::memcpy(&size, raw.data() + 4, sizeof(size));
        h.payload_size = swap32le(size);
        h.payload_offset = header_offset + chunk_header::header_size;

        const std::uint64_t stream_size = this->size();
        THROW_SIZE_MISMATCH_IF(h.end_offset() > stream_size,
                               "Chunk ", h.name, " at offset ", header_offset, " declares ",
                               h.payload_size, " payload bytes but only ",
                               stream_size - h.payload_offset, " remain in the stream");
        return h;
    }

    // reader implementation
    reader::reader(std::istream& is) : m_stream(is) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        // A short read leaves eof/fail set; later seeks clear it
        return bytes_read;
    }

    void reader::seek(std::uint64_t offset, whence_t whence) {
        m_stream.clear();

        std::ios_base::seekdir dir;
        switch (whence) {
            case set:
                dir = std::ios_base::beg;
                break;
            case cur:
                dir = std::ios_base::cur;
                break;
            case end:
                dir = std::ios_base::end;
                break;
            default:
                THROW_IO("Invalid whence value: ", static_cast<int>(whence));
        }

        m_stream.seekg(static_cast<std::streamoff>(offset), dir);
        if (m_stream.fail()) {
            m_stream.clear();
            m_stream.seekg(0, std::ios::end);
            auto size = m_stream.tellg();

            std::string error = "Cannot seek to offset " + std::to_string(offset);
            if (size != std::streampos(-1)) {
                error += " - stream size is only " + std::to_string(static_cast<std::streamoff>(size)) + " bytes";
            }
            THROW_IO(error);
        }
    }

    std::uint64_t reader::tell() const {
        std::streampos pos = m_stream.tellg();
        THROW_IO_IF(pos == std::streampos(-1), "Tell failed");
        return static_cast<std::uint64_t>(pos);
    }

    std::uint64_t reader::size() const {
        std::streampos current_pos = m_stream.tellg();
        THROW_IO_IF(current_pos == std::streampos(-1), "Tell failed in size()");

        m_stream.seekg(0, std::ios_base::end);
        std::streampos end_pos = m_stream.tellg();

        m_stream.seekg(current_pos);

        THROW_IO_IF(end_pos == std::streampos(-1), "Failed to get stream size");
        return static_cast<std::uint64_t>(end_pos);
    }
}
