//
// Created by igor on 17/08/2025.
//

#include <munge/level.hh>
#include <munge/fnv1a.hh>
#include <munge/exceptions.hh>

namespace munge {

    bool data_pack::has_name(std::string_view name) const {
        return fnv1a_matches(name_hash, name);
    }

    data_pack node_codec<data_pack>::decode(decode_context& ctx, const chunk_header& h) {
        auto guard = ctx.enter(h);
        auto it = ctx.children(h);
        THROW_MUNGE_IF(!it.has_next(), invalid_pack_error,
                       "Pack ", h.name, " at offset ", h.header_offset(), " is empty, expected exactly one child");
        const chunk_header inner = it.current();
        it.next();
        THROW_MUNGE_IF(it.has_next(), invalid_pack_error,
                       "Pack ", h.name, " at offset ", h.header_offset(), " holds a second child ",
                       it.current().name, ", expected exactly one");

        data_pack pack;
        pack.name_hash = inner.name.to_uint32();
        pack.contents = node_codec<level_data>::decode(ctx, inner);
        return pack;
    }

    void node_codec<data_pack>::encode(const data_pack& value, node_writer& w) {
        w.write_node(hashed_name{value.name_hash}, value.contents);
    }

} // namespace munge
