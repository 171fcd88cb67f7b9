/**
 * @file handler_registry.hh
 * @brief Event handler registry for chunk dispatch
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <unordered_map>

#include <munge/export_munge.h>
#include <munge/tag.hh>
#include <munge/chunk_name.hh>
#include <munge/chunk_header.hh>
#include <munge/chunk_reader.hh>
#include <munge/parse_options.hh>
#include <munge/node_codec.hh>

namespace munge {

    /**
     * @struct chunk_event
     * @brief A chunk handed to a handler
     *
     * Handlers may read the payload through open() or decode() as often as
     * they like; the dispatcher re-positions the stream afterwards.
     */
    struct chunk_event {
        const chunk_header& header;       ///< Chunk header information
        std::istream& stream;             ///< Stream the chunk lives in
        const parse_options& options;     ///< Options of the running parse
        int depth;                        ///< 1 for direct children of the root

        chunk_event() = delete;

        chunk_event(const chunk_header& h, std::istream& s, const parse_options& o, int d)
            : header(h), stream(s), options(o), depth(d) {}

        [[nodiscard]] std::unique_ptr<chunk_reader> open() const {
            return open_payload(stream, header);
        }

        template<typename T>
        T decode() const {
            return decode_node<T>(stream, header, options);
        }
    };

    /**
     * @typedef chunk_handler
     * @brief Function type for chunk event handlers
     */
    using chunk_handler = std::function<void(const chunk_event& event)>;

    /**
     * @class handler_registry
     * @brief Routes chunks to handlers by literal tag or hashed name
     *
     * Multiple handlers can be registered for the same name. Literal
     * handlers run before hashed ones. A chunk nobody claims goes to the
     * unknown handler, if set.
     */
    class MUNGE_EXPORT handler_registry {
    public:
        void on_chunk(const chunk_name& name, chunk_handler handler);

        void on_unknown(chunk_handler handler);

        /**
         * @brief Emit an event to all matching handlers
         * @return True if a named handler ran
         */
        bool emit(const chunk_event& event) const;

    private:
        std::unordered_multimap<tag, chunk_handler> tag_handlers_;
        std::unordered_multimap<std::uint32_t, chunk_handler> hashed_handlers_;
        chunk_handler unknown_handler_;
    };

} // namespace munge
