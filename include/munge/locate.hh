/**
 * @file locate.hh
 * @brief Resource lookup by '/' separated path
 * @date 18/08/2025
 *
 * "a/b/name" looks inside pack "a", then its nested pack "b", for a
 * resource called "name". Pack names are compared through their FNV-1a
 * hash, resource names byte for byte.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <munge/export_munge.h>
#include <munge/level.hh>

namespace munge {

    /**
     * @brief Split path into its segments
     * @throws content_error for an empty path or an empty segment
     */
    MUNGE_EXPORT std::vector<std::string> split_path(std::string_view path);

    /// Every segment names a pack. nullptr when absent.
    MUNGE_EXPORT const data_pack* find_pack(const level_data& level, std::string_view path);

    MUNGE_EXPORT const texture* find_texture(const level_data& level, std::string_view path);
    MUNGE_EXPORT const script* find_script(const level_data& level, std::string_view path);
    MUNGE_EXPORT const shader* find_shader(const level_data& level, std::string_view path);
    MUNGE_EXPORT const model* find_model(const level_data& level, std::string_view path);

} // namespace munge
