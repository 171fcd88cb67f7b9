//
// Created by igor on 16/08/2025.
//

#include <munge/fnv1a.hh>

namespace munge {

    std::uint32_t fnv1a(const void* data, std::size_t size) noexcept {
        return fnv1a(std::string_view(static_cast<const char*>(data), size));
    }

    bool fnv1a_matches(std::uint32_t hash, std::string_view name) noexcept {
        return fnv1a(name) == hash;
    }

} // namespace munge
