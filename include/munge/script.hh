//
// Created by igor on 17/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include <munge/export_munge.h>
#include <munge/tag.hh>
#include <munge/schema.hh>
#include <munge/lazy_payload.hh>

namespace munge {
    // Compiled script, chunk 'scr_'. The body is bytecode and is not
    // interpreted here.
    struct script {
        static constexpr tag chunk_tag = "scr_"_tag;

        std::string name;
        std::uint8_t info = 0;
        lazy_payload<std::vector<std::byte>> body;

        MUNGE_EXPORT static const record_schema<script>& schema();
    };
}
