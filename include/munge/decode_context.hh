/**
 * @file decode_context.hh
 * @brief State shared by one decode call
 * @date 15/08/2025
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <string_view>
#include <vector>

#include <munge/export_munge.h>
#include <munge/chunk_header.hh>
#include <munge/chunk_reader.hh>
#include <munge/child_iterator.hh>
#include <munge/parse_options.hh>

namespace munge {

    /**
     * @class decode_context
     * @brief Stream, options and nesting depth for one decode
     *
     * Created per call and never shared between threads.
     */
    class MUNGE_EXPORT decode_context {
    public:
        explicit decode_context(std::istream& stream, parse_options options = {});
        ~decode_context();

        decode_context(const decode_context&) = delete;
        decode_context& operator=(const decode_context&) = delete;

        [[nodiscard]] std::istream& stream() { return m_stream; }
        [[nodiscard]] const parse_options& options() const { return m_options; }
        [[nodiscard]] int depth() const { return m_depth; }

        /// Bounded reader over the payload of h
        std::unique_ptr<chunk_reader> open(const chunk_header& h);

        child_iterator children(const chunk_header& h);
        std::vector<chunk_header> read_children(const chunk_header& h);

        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
            m_options.warn(offset, category, message);
        }

        // Undoes one enter() on destruction
        class depth_guard {
        public:
            explicit depth_guard(decode_context& ctx) : m_ctx(&ctx) {}
            ~depth_guard() { if (m_ctx) --m_ctx->m_depth; }

            depth_guard(depth_guard&& other) noexcept : m_ctx(other.m_ctx) { other.m_ctx = nullptr; }
            depth_guard(const depth_guard&) = delete;
            depth_guard& operator=(const depth_guard&) = delete;
            depth_guard& operator=(depth_guard&&) = delete;

        private:
            decode_context* m_ctx;
        };

        /**
         * @brief Descend into the record held by h
         * @throws parse_error when max_depth would be exceeded
         */
        [[nodiscard]] depth_guard enter(const chunk_header& h);

    private:
        std::istream& m_stream;
        parse_options m_options;
        int m_depth = 0;
    };

} // namespace munge
