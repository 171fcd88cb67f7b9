//
// Created by igor on 14/08/2025.
//

#include <munge/chunk_reader.hh>
#include <munge/exceptions.hh>
#include <algorithm>

namespace munge {

    void chunk_reader::read_exact(void* dst, std::size_t size) {
        const std::uint64_t at = absolute_offset();
        std::size_t actual = read(dst, size);
        THROW_IO_IF(actual != size, "Unexpected end of payload at offset ", at, ": requested ",
                    size, " bytes, got ", actual);
    }

    std::vector<std::byte> chunk_reader::read_all() {
        std::size_t to_read = static_cast<std::size_t>(remaining());
        std::vector<std::byte> result(to_read);

        if (to_read > 0) {
            std::size_t actual = read(result.data(), to_read);
            result.resize(actual);
        }

        return result;
    }

    std::vector<std::byte> chunk_reader::read_bytes(std::size_t n) {
        std::size_t to_read = static_cast<std::size_t>(std::min(static_cast<std::uint64_t>(n), remaining()));
        std::vector<std::byte> result(to_read);

        if (to_read > 0) {
            std::size_t actual = read(result.data(), to_read);
            result.resize(actual);
        }

        return result;
    }

} // namespace munge
