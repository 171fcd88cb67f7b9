/**
 * @file schema.hh
 * @brief Declarative mapping from child chunks to record fields
 * @date 15/08/2025
 *
 * A record_schema is an ordered table of bindings built once per record
 * type. A single binding takes the first direct child whose tag equals its
 * tag. A repeated binding takes every child whose tag starts with its
 * pattern, in stream order. Children no binding claims are skipped, or
 * rejected in strict mode.
 *
 * @code
 * const record_schema<script>& script::schema() {
 *     static const auto s = record_schema<script>("script")
 *         .single("NAME"_tag, &script::name, "name")
 *         .single("INFO"_tag, &script::info, "info")
 *         .single("BODY"_tag, &script::body, "body");
 *     return s;
 * }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <munge/exceptions.hh>
#include <munge/tag.hh>
#include <munge/chunk_header.hh>
#include <munge/decode_context.hh>
#include <munge/node_writer.hh>
#include <munge/node_codec.hh>

namespace munge {

    enum class binding_kind {
        single,
        repeated
    };

    template<typename Record>
    class record_schema {
    public:
        struct binding {
            std::string field_name;
            tag_pattern pattern;
            binding_kind kind;
            // Decodes one matched child into the record
            std::function<void(Record&, decode_context&, const chunk_header&)> decode;
            std::function<void(const Record&, node_writer&)> encode;
        };

        explicit record_schema(std::string name)
            : m_name(std::move(name)) {}

        template<typename Field>
        record_schema& single(const tag& t, Field Record::*member, std::string field_name) {
            m_bindings.push_back(binding{
                std::move(field_name),
                tag_pattern(t),
                binding_kind::single,
                [member](Record& r, decode_context& ctx, const chunk_header& h) {
                    r.*member = node_codec<Field>::decode(ctx, h);
                },
                [member, t](const Record& r, node_writer& w) {
                    w.write_node(t, r.*member);
                }
            });
            return *this;
        }

        template<typename Field>
        record_schema& repeated(const tag_pattern& p, std::vector<Field> Record::*member, std::string field_name) {
            m_bindings.push_back(binding{
                field_name,
                p,
                binding_kind::repeated,
                [member](Record& r, decode_context& ctx, const chunk_header& h) {
                    (r.*member).push_back(node_codec<Field>::decode(ctx, h));
                },
                [member, p, field_name](const Record& r, node_writer& w) {
                    const auto& items = r.*member;
                    if (items.empty()) {
                        return;
                    }
                    THROW_CONTENT_IF(!p.is_exact(),
                                     "Cannot write field '", field_name, "': pattern ", p,
                                     " does not name a single tag");
                    for (const auto& item : items) {
                        w.write_node(p.as_tag(), item);
                    }
                }
            });
            return *this;
        }

        [[nodiscard]] const std::string& name() const { return m_name; }
        [[nodiscard]] const std::vector<binding>& bindings() const { return m_bindings; }

        /**
         * @brief Decode the children of h into a new record
         *
         * The first failing field aborts the whole record.
         *
         * @throws missing_child_error when a single field has no child
         * @throws content_error for an unclaimed child in strict mode
         */
        Record decode(decode_context& ctx, const chunk_header& h) const {
            auto guard = ctx.enter(h);
            const auto children = ctx.read_children(h);
            std::vector<bool> claimed(children.size(), false);

            Record record{};
            for (const auto& b : m_bindings) {
                if (b.kind == binding_kind::single) {
                    decode_single(b, record, ctx, h, children, claimed);
                } else {
                    for (std::size_t i = 0; i < children.size(); i++) {
                        if (b.pattern.matches(children[i].name)) {
                            claimed[i] = true;
                            b.decode(record, ctx, children[i]);
                        }
                    }
                }
            }

            for (std::size_t i = 0; i < children.size(); i++) {
                if (claimed[i]) {
                    continue;
                }
                const auto& c = children[i];
                THROW_CONTENT_IF(ctx.options().strict,
                                 "Unexpected child ", c.name, " at offset ", c.header_offset(),
                                 " in ", m_name, " ", h.name);
                ctx.warn(c.header_offset(), "unknown_child",
                         build_error_msg("Skipping child ", c.name, " of ", m_name, " ", h.name));
            }
            return record;
        }

        /**
         * @brief Write every field as child chunks, in binding order
         */
        void encode(const Record& record, node_writer& w) const {
            for (const auto& b : m_bindings) {
                b.encode(record, w);
            }
        }

    private:
        void decode_single(const binding& b, Record& record, decode_context& ctx, const chunk_header& h,
                           const std::vector<chunk_header>& children, std::vector<bool>& claimed) const {
            const chunk_header* found = nullptr;
            for (std::size_t i = 0; i < children.size(); i++) {
                if (!b.pattern.matches(children[i].name)) {
                    continue;
                }
                claimed[i] = true;
                if (found) {
                    ctx.warn(children[i].header_offset(), "duplicate_child",
                             build_error_msg("Ignoring repeated ", children[i].name, " for field '",
                                             b.field_name, "' of ", m_name));
                } else {
                    found = &children[i];
                }
            }
            THROW_MUNGE_IF(!found, missing_child_error,
                           "Missing child ", b.pattern, " for field '", b.field_name, "' of ", m_name,
                           " ", h.name, " at offset ", h.header_offset());
            b.decode(record, ctx, *found);
        }

        std::string m_name;
        std::vector<binding> m_bindings;
    };

} // namespace munge
