//
// Created by igor on 17/08/2025.
//

#include <munge/shader.hh>

namespace munge {

    const record_schema<shader>& shader::schema() {
        static const auto s = record_schema<shader>("shader")
            .single("NAME"_tag, &shader::name, "name")
            .single("CODE"_tag, &shader::code, "code");
        return s;
    }

} // namespace munge
