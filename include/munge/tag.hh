//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <stdexcept>

#include <munge/endian.hh>

namespace munge {
    // Four raw bytes identifying a chunk. Content is not validated: hashed
    // pack children carry arbitrary bytes here.
    struct tag {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr tag() = default;

        constexpr tag(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        constexpr tag(std::byte c0, std::byte c1, std::byte c2, std::byte c3)
            : b{ static_cast<char>(c0), static_cast<char>(c1), static_cast<char>(c2), static_cast<char>(c3) } {}

        // Constructor from string_view with padding (runtime)
        explicit tag(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), std::size_t(4)), b.begin());
        }

        static tag from_bytes(const void* data) {
            tag result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        // The four bytes read as a little endian u32
        static tag from_uint32(std::uint32_t value) {
            value = swap32le(value);
            return from_bytes(&value);
        }

        [[nodiscard]] std::uint32_t to_uint32() const {
            std::uint32_t result;
            std::memcpy(&result, b.data(), 4);
            return swap32le(result);
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }
        constexpr char& operator[](std::size_t i) { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        bool operator==(const tag& o) const { return b == o.b; }
        bool operator!=(const tag& o) const { return !(*this == o); }
        bool operator<(const tag& o) const { return b < o.b; }

        // Check if contains only printable ASCII
        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return c >= 32 && c <= 126;
            });
        }

        friend std::ostream& operator<<(std::ostream& os, const tag& t) {
            if ((os.flags() & std::ios::hex) || !t.is_printable()) {
                auto flags = os.flags();
                auto fill = os.fill();
                os << "0x" << std::hex << std::setfill('0') << std::setw(8)
                   << t.to_uint32();
                os.flags(flags);
                os.fill(fill);
            } else {
                os << '\'' << t.to_string_view() << '\'';
            }
            return os;
        }
    };

    struct tag_hash {
        std::size_t operator()(const tag& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Compile-time tag, must be exactly four characters
    constexpr tag operator""_tag(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("tag literal must be exactly 4 characters");
        }
        return {str[0], str[1], str[2], str[3]};
    }

    /**
     * @class tag_pattern
     * @brief One to four leading tag bytes
     *
     * A four byte pattern matches one tag exactly, a shorter one matches
     * every tag starting with it.
     */
    class tag_pattern {
    public:
        constexpr tag_pattern(const tag& t)
            : m_bytes(t.b), m_size(4) {}

        tag_pattern(std::string_view prefix) {
            if (prefix.empty() || prefix.size() > 4) {
                throw std::invalid_argument("tag pattern must hold 1 to 4 characters");
            }
            std::copy(prefix.begin(), prefix.end(), m_bytes.begin());
            m_size = prefix.size();
        }

        tag_pattern(const char* prefix) : tag_pattern(std::string_view(prefix)) {}

        [[nodiscard]] bool matches(const tag& t) const {
            return std::equal(m_bytes.begin(), m_bytes.begin() + static_cast<std::ptrdiff_t>(m_size), t.b.begin());
        }

        [[nodiscard]] bool is_exact() const { return m_size == 4; }

        // Only meaningful when is_exact()
        [[nodiscard]] tag as_tag() const { return tag::from_bytes(m_bytes.data()); }

        [[nodiscard]] std::string_view prefix() const { return {m_bytes.data(), m_size}; }

        friend std::ostream& operator<<(std::ostream& os, const tag_pattern& p) {
            os << '\'' << p.prefix();
            if (!p.is_exact()) {
                os << '*';
            }
            return os << '\'';
        }

    private:
        std::array<char, 4> m_bytes{' ', ' ', ' ', ' '};
        std::size_t m_size = 0;
    };
}

namespace std {
    template<>
    struct hash<munge::tag> {
        std::size_t operator()(const munge::tag& t) const noexcept {
            return munge::tag_hash{}(t);
        }
    };
}
