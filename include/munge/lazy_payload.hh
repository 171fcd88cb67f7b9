/**
 * @file lazy_payload.hh
 * @brief Deferred payload handle
 * @date 16/08/2025
 */

#pragma once

#include <iosfwd>
#include <utility>
#include <variant>

#include <munge/exceptions.hh>
#include <munge/chunk_header.hh>
#include <munge/decode_context.hh>
#include <munge/node_writer.hh>
#include <munge/node_codec.hh>

namespace munge {

    /**
     * @class lazy_payload
     * @brief A chunk whose payload is decoded only on request
     *
     * A deferred handle holds just the chunk header; building it reads no
     * payload bytes. Every read() decodes again from the stream it is
     * given and nothing is cached, so reads are idempotent and a handle
     * may be copied to another thread freely.
     *
     * A handle may instead own a value to be written (authoring form).
     */
    template<typename T>
    class lazy_payload {
    public:
        lazy_payload() : m_state(T{}) {}

        explicit lazy_payload(const chunk_header& h) : m_state(h) {}

        explicit lazy_payload(T value) : m_state(std::move(value)) {}

        [[nodiscard]] bool is_deferred() const {
            return std::holds_alternative<chunk_header>(m_state);
        }

        /**
         * @throws content_error if the handle owns a value
         */
        [[nodiscard]] const chunk_header& header() const {
            const auto* h = std::get_if<chunk_header>(&m_state);
            THROW_CONTENT_IF(!h, "Payload handle owns a value and has no header");
            return *h;
        }

        /**
         * @throws content_error if the handle is deferred
         */
        [[nodiscard]] const T& value() const {
            const auto* v = std::get_if<T>(&m_state);
            THROW_CONTENT_IF(!v, "Payload handle is deferred, read it from its stream");
            return *v;
        }

        /**
         * @brief Decode the payload
         *
         * stream must be the one the handle was read from, or any other
         * stream over the same bytes. Copies of a handle may read from
         * separate streams concurrently. stream is unused for handles that
         * own a value.
         */
        T read(std::istream& stream, const parse_options& options = {}) const {
            if (const auto* v = std::get_if<T>(&m_state)) {
                return *v;
            }
            decode_context ctx(stream, options);
            return node_codec<T>::decode(ctx, std::get<chunk_header>(m_state));
        }

    private:
        std::variant<T, chunk_header> m_state;
    };

    template<typename T>
    struct node_codec<lazy_payload<T>> {
        static lazy_payload<T> decode(decode_context&, const chunk_header& h) {
            return lazy_payload<T>(h);
        }

        /**
         * @throws content_error for a deferred handle when the writer has no
         *         source stream
         */
        static void encode(const lazy_payload<T>& value, node_writer& w) {
            if (value.is_deferred()) {
                THROW_CONTENT_IF(!w.source(),
                                 "Cannot write deferred payload ", value.header().name, " at offset ",
                                 value.header().header_offset(), ": writer has no source stream");
                node_codec<T>::encode(value.read(*w.source()), w);
            } else {
                node_codec<T>::encode(value.value(), w);
            }
        }
    };

} // namespace munge
