/**
 * @file parse_options.hh
 * @brief Decoding options
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace munge {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding munge data
     *
     * Defaults match the game's own reader: unknown children are skipped,
     * sizes must add up exactly.
     */
    struct parse_options {
        /**
         * @brief Strict mode
         *
         * When true, a child that no schema field claims raises
         * content_error. When false it is skipped and reported through
         * on_warning as "unknown_child".
         */
        bool strict = false;

        /**
         * @brief Tolerate zero padding between children
         *
         * Some shipped files align children to four bytes. When true, up to
         * three zero bytes before a child header (or at the end of a parent)
         * are skipped and reported as "padding".
         */
        bool allow_padding = false;

        /**
         * @brief Children are preceded by a u32 child count
         *
         * Some shipped containers store the number of children before the
         * first child header. When true, every parent payload starts with
         * that count and the children that follow must match it exactly,
         * otherwise size_mismatch_error.
         */
        bool count_prefix = false;

        /**
         * @brief Maximum record nesting depth
         *
         * Protects against hostile, deeply nested files.
         */
        int max_depth = 64;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset where warning occurred
         * @param category Warning category ("unknown_child", "duplicate_child", "padding")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;

        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
            if (on_warning) {
                on_warning(offset, category, message);
            }
        }
    };

} // namespace munge
