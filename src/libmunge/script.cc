//
// Created by igor on 17/08/2025.
//

#include <munge/script.hh>

namespace munge {

    const record_schema<script>& script::schema() {
        static const auto s = record_schema<script>("script")
            .single("NAME"_tag, &script::name, "name")
            .single("INFO"_tag, &script::info, "info")
            .single("BODY"_tag, &script::body, "body");
        return s;
    }

} // namespace munge
