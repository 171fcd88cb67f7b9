/**
 * @file chunk_name.hh
 * @brief Literal and hashed chunk identities
 * @date 16/08/2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <munge/export_munge.h>
#include <munge/tag.hh>

namespace munge {

    /**
     * @struct hashed_name
     * @brief A chunk identified by the hash of a resource name
     *
     * On the wire the hash is stored in the tag slot, little endian.
     */
    struct hashed_name {
        std::uint32_t value = 0;

        MUNGE_EXPORT static hashed_name of(std::string_view name);

        bool operator==(const hashed_name& o) const { return value == o.value; }
        bool operator!=(const hashed_name& o) const { return value != o.value; }
    };

    using chunk_name = std::variant<tag, hashed_name>;

    /**
     * @brief The four wire bytes for a name
     */
    MUNGE_EXPORT tag resolve(const chunk_name& name);

    /**
     * @brief True when a chunk carrying tag t answers to name
     */
    MUNGE_EXPORT bool matches(const chunk_name& name, const tag& t);

    /**
     * @brief Human readable form: "'NAME'" or "#1234abcd"
     */
    MUNGE_EXPORT std::string to_string(const chunk_name& name);
}
