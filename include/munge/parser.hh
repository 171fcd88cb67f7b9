/**
 * @file parser.hh
 * @brief Root chunk dispatch
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <iosfwd>

#include <munge/handler_registry.hh>
#include <munge/child_iterator.hh>
#include <munge/parse_options.hh>
#include <munge/level.hh>

namespace munge {

    /**
     * @brief Parse a stream with handler registry and custom options
     *
     * Reads the 'ucfb' root and emits one event per direct child, in
     * stream order.
     *
     * @param stream Input stream containing munge data
     * @param handlers Registry of event handlers to process chunks
     * @param options Parse options for controlling parsing behavior
     * @throws content_error if the root chunk is not 'ucfb'
     */
    inline void parse(std::istream& stream, const handler_registry& handlers, const parse_options& options) {
        const chunk_header root = read_root(stream);
        child_iterator it(stream, root, options);

        while (it.has_next()) {
            chunk_event event(it.current(), stream, options, 1);
            handlers.emit(event);
            it.next();
        }
    }

    /**
     * @brief Parse a stream with handler registry
     *
     * Uses default parse options.
     */
    inline void parse(std::istream& stream, const handler_registry& handlers) {
        parse(stream, handlers, parse_options{});
    }

    /**
     * @brief Visit h and, if its payload is a chunk list, its descendants
     *
     * Only one child_iterator per level is alive, so memory grows with
     * depth, not with the number of siblings.
     */
    template<typename Func>
    void walk_chunk(std::istream& stream, const chunk_header& h, int depth, Func& func,
                    const parse_options& options) {
        THROW_PARSE_IF(depth > options.max_depth, "Maximum nesting depth ", options.max_depth,
                       " exceeded at offset ", h.header_offset());
        // Payloads that do not split into children exactly are leaves
        if (!looks_like_container(stream, h, options)) {
            func(h, depth, true);
            return;
        }

        child_iterator it(stream, h, options);
        func(h, depth, it.at_end());
        for (; it.has_next(); it.next()) {
            const chunk_header child = it.current();
            walk_chunk(stream, child, depth + 1, func, options);
        }
    }

    /**
     * @brief Depth-first walk over every chunk below the root
     *
     * Every payload is tentatively treated as a list of children: when it
     * does not split into children exactly, the chunk is reported as a
     * leaf. The root itself is visited first at depth 0.
     *
     * @tparam Func Callable accepting (const chunk_header&, int depth, bool is_leaf)
     */
    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func, const parse_options& options) {
        const chunk_header root = read_header(stream);
        walk_chunk(stream, root, 0, func, options);
    }

    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func) {
        for_each_chunk(stream, func, parse_options{});
    }

} // namespace munge
