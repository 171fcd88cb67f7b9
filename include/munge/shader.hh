//
// Created by igor on 17/08/2025.
//

#pragma once

#include <string>

#include <munge/export_munge.h>
#include <munge/tag.hh>
#include <munge/schema.hh>

namespace munge {
    // WGSL shader source, chunk 'WGSL'. Engine extension, not found in
    // original game files.
    struct shader {
        static constexpr tag chunk_tag = "WGSL"_tag;

        std::string name;
        std::string code;

        MUNGE_EXPORT static const record_schema<shader>& schema();
    };
}
