//
// Created by igor on 16/08/2025.
//

#include <iomanip>
#include <sstream>

#include <munge/chunk_name.hh>
#include <munge/fnv1a.hh>

namespace munge {

    hashed_name hashed_name::of(std::string_view name) {
        return hashed_name{fnv1a(name)};
    }

    tag resolve(const chunk_name& name) {
        if (const auto* t = std::get_if<tag>(&name)) {
            return *t;
        }
        return tag::from_uint32(std::get<hashed_name>(name).value);
    }

    bool matches(const chunk_name& name, const tag& t) {
        if (const auto* literal = std::get_if<tag>(&name)) {
            return *literal == t;
        }
        return std::get<hashed_name>(name).value == t.to_uint32();
    }

    std::string to_string(const chunk_name& name) {
        std::ostringstream os;
        if (const auto* t = std::get_if<tag>(&name)) {
            os << *t;
        } else {
            os << '#' << std::hex << std::setfill('0') << std::setw(8) << std::get<hashed_name>(name).value;
        }
        return os.str();
    }

} // namespace munge
