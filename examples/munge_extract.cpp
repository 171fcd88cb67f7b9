/**
 * @file munge_extract.cpp
 * @brief Extract a script body or texture mip level from a level file
 *
 * Resources inside packs are addressed with '/', e.g. "side/rep/soldier".
 */

#include <munge/level.hh>
#include <munge/locate.hh>
#include <munge/texture.hh>
#include <iostream>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    void usage(const char* program) {
        std::cout << "Usage:\n";
        std::cout << "  " << program << " <file> script <path> <out>\n";
        std::cout << "  " << program << " <file> texture <path> <out> [--format NAME] [--face N] [--mip N]\n";
        std::cout << "\n";
        std::cout << "If a texture stores a single format, --format may be omitted.\n";
    }

    std::optional<munge::texture_format_kind> parse_format(const std::string& name) {
        for (auto kind : munge::enum_traits<munge::texture_format_kind>::values) {
            if (munge::to_string(kind) == name) {
                return kind;
            }
        }
        return std::nullopt;
    }

    bool write_file(const std::string& path, const std::vector<std::byte>& data) {
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            std::cerr << "Error: Cannot create file '" << path << "'\n";
            return false;
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) {
            std::cerr << "Error: Failed writing '" << path << "'\n";
            return false;
        }
        std::cout << "Wrote " << data.size() << " bytes to " << path << "\n";
        return true;
    }

    int extract_script(std::istream& file, const munge::level_data& level, const std::string& path,
                       const std::string& out) {
        const auto* found = munge::find_script(level, path);
        if (!found) {
            std::cerr << "Error: No script '" << path << "'\n";
            return 1;
        }
        return write_file(out, found->body.read(file)) ? 0 : 1;
    }

    int extract_texture(std::istream& file, const munge::level_data& level, const std::string& path,
                        const std::string& out, const std::optional<munge::texture_format_kind>& format,
                        std::size_t face, std::uint32_t mip) {
        const auto* found = munge::find_texture(level, path);
        if (!found) {
            std::cerr << "Error: No texture '" << path << "'\n";
            return 1;
        }

        const munge::texture_format* fmt = nullptr;
        if (format) {
            fmt = found->find_format(*format);
        } else if (found->formats.size() == 1) {
            fmt = &found->formats.front();
        } else {
            std::cerr << "Error: Texture has " << found->formats.size() << " formats, pick one with --format:";
            for (const auto& f : found->formats) {
                std::cerr << " " << munge::to_string(f.info.format);
            }
            std::cerr << "\n";
            return 1;
        }
        if (!fmt) {
            std::cerr << "Error: Texture does not store the requested format\n";
            return 1;
        }
        if (face >= fmt->faces.size()) {
            std::cerr << "Error: Face " << face << " out of range (" << fmt->faces.size() << " faces)\n";
            return 1;
        }

        for (const auto& level_mip : fmt->faces[face].mipmaps) {
            if (level_mip.info.mip_level == mip) {
                std::cout << munge::to_string(fmt->info.format) << " " << fmt->info.width << "x"
                          << fmt->info.height << ", mip " << mip << "\n";
                return write_file(out, level_mip.body.read(file)) ? 0 : 1;
            }
        }
        std::cerr << "Error: Mip level " << mip << " not found\n";
        return 1;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 5) {
        usage(argv[0]);
        return 1;
    }

    const std::string file_path = argv[1];
    const std::string kind = argv[2];
    const std::string resource = argv[3];
    const std::string out = argv[4];

    std::optional<munge::texture_format_kind> format;
    std::size_t face = 0;
    std::uint32_t mip = 0;

    for (int i = 5; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            usage(argv[0]);
            return 1;
        }
        std::string value = argv[++i];
        if (arg == "--format") {
            format = parse_format(value);
            if (!format) {
                std::cerr << "Error: Unknown format '" << value << "'\n";
                return 1;
            }
        } else if (arg == "--face" || arg == "--mip") {
            unsigned long n = 0;
            try {
                n = std::stoul(value);
            } catch (const std::logic_error&) {
                std::cerr << "Error: '" << value << "' is not a number\n";
                return 1;
            }
            if (arg == "--face") {
                face = n;
            } else {
                mip = static_cast<std::uint32_t>(n);
            }
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << file_path << "'\n";
        return 1;
    }

    try {
        const auto level = munge::load_level(file);
        if (kind == "script") {
            return extract_script(file, level, resource, out);
        }
        if (kind == "texture") {
            return extract_texture(file, level, resource, out, format, face, mip);
        }
        usage(argv[0]);
        return 1;
    } catch (const munge::munge_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
