//
// Created by igor on 17/08/2025.
//

#include <munge/texture.hh>

namespace munge {

    std::uint32_t channel_count(texture_format_kind kind) {
        switch (kind) {
            case texture_format_kind::dxt1:
            case texture_format_kind::dxt3:
            case texture_format_kind::a8r8g8b8:
            case texture_format_kind::a1r5g5b5:
            case texture_format_kind::a4r4g4b4:
                return 4;
            case texture_format_kind::r5g6b5:
                return 3;
            case texture_format_kind::a8l8:
            case texture_format_kind::a4l4:
            case texture_format_kind::v8u8:
                return 2;
            case texture_format_kind::a8:
            case texture_format_kind::l8:
                return 1;
        }
        const auto value = static_cast<std::uint32_t>(kind);
        throw invalid_discriminant_error(build_error_msg("Invalid texture format ", value), value);
    }

    bool is_compressed(texture_format_kind kind) {
        return kind == texture_format_kind::dxt1 || kind == texture_format_kind::dxt3;
    }

    std::string_view to_string(texture_format_kind kind) {
        switch (kind) {
            case texture_format_kind::dxt1: return "DXT1";
            case texture_format_kind::dxt3: return "DXT3";
            case texture_format_kind::a8r8g8b8: return "A8R8G8B8";
            case texture_format_kind::r5g6b5: return "R5G6B5";
            case texture_format_kind::a1r5g5b5: return "A1R5G5B5";
            case texture_format_kind::a4r4g4b4: return "A4R4G4B4";
            case texture_format_kind::a8: return "A8";
            case texture_format_kind::l8: return "L8";
            case texture_format_kind::a8l8: return "A8L8";
            case texture_format_kind::a4l4: return "A4L4";
            case texture_format_kind::v8u8: return "V8U8";
        }
        return "unknown";
    }

    std::string_view to_string(texture_kind kind) {
        switch (kind) {
            case texture_kind::normal: return "normal";
            case texture_kind::cubemap: return "cubemap";
        }
        return "unknown";
    }

    texture_format_info packed_traits<texture_format_info>::read(chunk_reader& r) {
        texture_format_info info;
        info.format = read_packed<texture_format_kind>(r);
        info.width = read_packed<std::uint16_t>(r);
        info.height = read_packed<std::uint16_t>(r);
        info.depth = read_packed<std::uint16_t>(r);
        info.mipmaps = read_packed<std::uint16_t>(r);
        info.kind = read_packed<texture_kind>(r);
        return info;
    }

    void packed_traits<texture_format_info>::write(std::vector<std::byte>& out, const texture_format_info& value) {
        write_packed(out, value.format);
        write_packed(out, value.width);
        write_packed(out, value.height);
        write_packed(out, value.depth);
        write_packed(out, value.mipmaps);
        write_packed(out, value.kind);
    }

    texture_mipmap_info packed_traits<texture_mipmap_info>::read(chunk_reader& r) {
        texture_mipmap_info info;
        info.mip_level = read_packed<std::uint32_t>(r);
        info.body_size = read_packed<std::uint32_t>(r);
        return info;
    }

    void packed_traits<texture_mipmap_info>::write(std::vector<std::byte>& out, const texture_mipmap_info& value) {
        write_packed(out, value.mip_level);
        write_packed(out, value.body_size);
    }

    const record_schema<texture_mipmap>& texture_mipmap::schema() {
        static const auto s = record_schema<texture_mipmap>("texture mip level")
            .single("INFO"_tag, &texture_mipmap::info, "info")
            .single("BODY"_tag, &texture_mipmap::body, "body");
        return s;
    }

    const record_schema<texture_face>& texture_face::schema() {
        static const auto s = record_schema<texture_face>("texture face")
            .repeated("LVL_", &texture_face::mipmaps, "mipmaps");
        return s;
    }

    const record_schema<texture_format>& texture_format::schema() {
        static const auto s = record_schema<texture_format>("texture format")
            .single("INFO"_tag, &texture_format::info, "info")
            .repeated("FACE", &texture_format::faces, "faces");
        return s;
    }

    const record_schema<texture>& texture::schema() {
        static const auto s = record_schema<texture>("texture")
            .single("NAME"_tag, &texture::name, "name")
            .repeated("FMT_", &texture::formats, "formats");
        return s;
    }

    const texture_format* texture::find_format(texture_format_kind kind) const {
        for (const auto& f : formats) {
            if (f.info.format == kind) {
                return &f;
            }
        }
        return nullptr;
    }

} // namespace munge
