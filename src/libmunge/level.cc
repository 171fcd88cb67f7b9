//
// Created by igor on 17/08/2025.
//

#include <istream>
#include <ostream>

#include <munge/level.hh>
#include <munge/exceptions.hh>

namespace munge {

    const record_schema<level_data>& level_data::schema() {
        static const auto s = record_schema<level_data>("level")
            .repeated(data_pack::chunk_tag, &level_data::packs, "packs")
            .repeated(script::chunk_tag, &level_data::scripts, "scripts")
            .repeated(texture::chunk_tag, &level_data::textures, "textures")
            .repeated(shader::chunk_tag, &level_data::shaders, "shaders")
            .repeated(model::chunk_tag, &level_data::models, "models");
        return s;
    }

    chunk_header read_root(std::istream& stream) {
        const chunk_header root = read_header(stream);
        THROW_CONTENT_IF(root.name != root_tag,
                         "Not a munge file: root chunk is ", root.name, ", expected ", root_tag);
        return root;
    }

    level_data load_level(std::istream& stream, const parse_options& options) {
        const chunk_header root = read_root(stream);
        decode_context ctx(stream, options);
        return node_codec<level_data>::decode(ctx, root);
    }

    void save_level(std::ostream& stream, const level_data& level, std::istream* source) {
        node_writer root(root_tag, source);
        node_codec<level_data>::encode(level, root);
        root.finish(stream);
    }

} // namespace munge
