//
// Created by igor on 15/08/2025.
//

#include <munge/packed.hh>
#include <munge/exceptions.hh>

namespace munge {

    std::string packed_traits<std::string>::read(chunk_reader& r) {
        const std::uint64_t start = r.absolute_offset();
        std::string result;

        while (true) {
            char c;
            const bool got = r.read(&c, 1) == 1;
            THROW_MUNGE_IF(result.size() == max_length && (!got || c != '\0'), string_too_long_error,
                           "String at offset ", start, " has no terminator after ", max_length, " bytes");
            THROW_IO_IF(!got, "Unterminated string at offset ", start, ": payload ends after ",
                        result.size(), " bytes");
            if (c == '\0') {
                return result;
            }
            result.push_back(c);
        }
    }

    void packed_traits<std::string>::write(std::vector<std::byte>& out, const std::string& value) {
        THROW_MUNGE_IF(value.size() > max_length, string_too_long_error,
                       "String of ", value.size(), " bytes exceeds the ", max_length, " byte limit");
        append_raw(out, value.data(), value.size());
        out.push_back(std::byte{0});
    }

    std::vector<std::byte> packed_traits<std::vector<std::byte>>::read(chunk_reader& r) {
        return r.read_all();
    }

    void packed_traits<std::vector<std::byte>>::write(std::vector<std::byte>& out,
                                                      const std::vector<std::byte>& value) {
        out.insert(out.end(), value.begin(), value.end());
    }

} // namespace munge
