//
// Created by igor on 14/08/2025.
//

#include <array>
#include <cstring>
#include <ostream>

#include <munge/chunk_header.hh>
#include <munge/endian.hh>
#include <munge/exceptions.hh>
#include "input.hh"

namespace munge {
    namespace {
        std::array<char, chunk_header::header_size> encode_header(const tag& name, std::uint32_t payload_size) {
            std::array<char, chunk_header::header_size> raw{};
            name.to_bytes(raw.data());
            const std::uint32_t le = swap32le(payload_size);
            std::memcpy(raw.data() + 4, &le, sizeof(le));
            return raw;
        }
    }

    chunk_header read_header(std::istream& stream) {
        reader r(stream);
        return r.read_header();
    }

    void write_header(std::ostream& stream, const tag& name, std::uint32_t payload_size) {
        const auto raw = encode_header(name, payload_size);
        stream.write(raw.data(), static_cast<std::streamsize>(raw.size()));
        THROW_IO_UNLESS(stream.good(), "Failed to write header of chunk ", name);
    }

    void append_header(std::vector<std::byte>& buffer, const tag& name, std::uint32_t payload_size) {
        const auto raw = encode_header(name, payload_size);
        const auto* p = reinterpret_cast<const std::byte*>(raw.data());
        buffer.insert(buffer.end(), p, p + raw.size());
    }
}
