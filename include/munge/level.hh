/**
 * @file level.hh
 * @brief Level files and the hash-addressed packs nested in them
 * @date 17/08/2025
 *
 * A level file is a single 'ucfb' chunk whose children are resources.
 * A pack ('lvl_') groups resources under a hashed name: it holds exactly
 * one child whose tag bytes are the FNV-1a hash of the pack name and
 * whose payload is another level body.
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>

#include <munge/export_munge.h>
#include <munge/tag.hh>
#include <munge/parse_options.hh>
#include <munge/schema.hh>
#include <munge/script.hh>
#include <munge/shader.hh>
#include <munge/texture.hh>
#include <munge/model.hh>

namespace munge {

    constexpr tag root_tag = "ucfb"_tag;

    struct data_pack;

    struct level_data {
        std::vector<data_pack> packs;
        std::vector<script> scripts;
        std::vector<texture> textures;
        std::vector<shader> shaders;
        std::vector<model> models;

        MUNGE_EXPORT static const record_schema<level_data>& schema();
    };

    struct data_pack {
        static constexpr tag chunk_tag = "lvl_"_tag;

        std::uint32_t name_hash = 0;
        level_data contents;

        /// True when name hashes to name_hash
        MUNGE_EXPORT bool has_name(std::string_view name) const;
    };

    template<>
    struct MUNGE_EXPORT node_codec<data_pack> {
        /**
         * @throws invalid_pack_error unless the pack holds exactly one child
         */
        static data_pack decode(decode_context& ctx, const chunk_header& h);
        static void encode(const data_pack& value, node_writer& w);
    };

    /**
     * @brief Read the root header at the current stream position
     * @throws content_error if the root chunk is not 'ucfb'
     */
    MUNGE_EXPORT chunk_header read_root(std::istream& stream);

    /**
     * @brief Read a level file
     *
     * Lazy payloads in the result refer back to stream.
     *
     * @throws content_error if the root chunk is not 'ucfb'
     */
    MUNGE_EXPORT level_data load_level(std::istream& stream, const parse_options& options = {});

    /**
     * @brief Write level as a 'ucfb' file
     *
     * source is the stream the level was loaded from; it is needed when
     * the level still holds deferred payloads.
     */
    MUNGE_EXPORT void save_level(std::ostream& stream, const level_data& level, std::istream* source = nullptr);

} // namespace munge
