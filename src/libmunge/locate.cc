//
// Created by igor on 18/08/2025.
//

#include <munge/locate.hh>
#include <munge/exceptions.hh>

namespace munge {
    namespace {
        // Walks every segment but the last through nested packs
        const level_data* descend(const level_data& level, const std::vector<std::string>& segments,
                                  std::size_t count) {
            const level_data* current = &level;
            for (std::size_t i = 0; i < count; i++) {
                const data_pack* next = nullptr;
                for (const auto& pack : current->packs) {
                    if (pack.has_name(segments[i])) {
                        next = &pack;
                        break;
                    }
                }
                if (!next) {
                    return nullptr;
                }
                current = &next->contents;
            }
            return current;
        }

        template<typename Resource>
        const Resource* find_named(const std::vector<Resource>& resources, const std::string& name) {
            for (const auto& r : resources) {
                if (r.name == name) {
                    return &r;
                }
            }
            return nullptr;
        }

        template<typename Resource>
        const Resource* find_resource(const level_data& level, std::string_view path,
                                      std::vector<Resource> level_data::*list) {
            const auto segments = split_path(path);
            const level_data* owner = descend(level, segments, segments.size() - 1);
            if (!owner) {
                return nullptr;
            }
            return find_named(owner->*list, segments.back());
        }
    }

    std::vector<std::string> split_path(std::string_view path) {
        THROW_CONTENT_IF(path.empty(), "Empty resource path");

        std::vector<std::string> segments;
        std::size_t start = 0;
        while (true) {
            const std::size_t slash = path.find('/', start);
            const std::string_view segment = path.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
            THROW_CONTENT_IF(segment.empty(),
                             "Empty segment in resource path '", path, "'");
            segments.emplace_back(segment);
            if (slash == std::string_view::npos) {
                break;
            }
            start = slash + 1;
        }
        return segments;
    }

    const data_pack* find_pack(const level_data& level, std::string_view path) {
        const auto segments = split_path(path);
        const level_data* parent = descend(level, segments, segments.size() - 1);
        if (!parent) {
            return nullptr;
        }
        for (const auto& pack : parent->packs) {
            if (pack.has_name(segments.back())) {
                return &pack;
            }
        }
        return nullptr;
    }

    const texture* find_texture(const level_data& level, std::string_view path) {
        return find_resource(level, path, &level_data::textures);
    }

    const script* find_script(const level_data& level, std::string_view path) {
        return find_resource(level, path, &level_data::scripts);
    }

    const shader* find_shader(const level_data& level, std::string_view path) {
        return find_resource(level, path, &level_data::shaders);
    }

    const model* find_model(const level_data& level, std::string_view path) {
        return find_resource(level, path, &level_data::models);
    }

} // namespace munge
