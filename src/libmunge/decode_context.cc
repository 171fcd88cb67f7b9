//
// Created by igor on 15/08/2025.
//

#include <munge/decode_context.hh>
#include <munge/exceptions.hh>

#include <utility>

namespace munge {

    decode_context::decode_context(std::istream& stream, parse_options options)
        : m_stream(stream),
          m_options(std::move(options)) {
    }

    decode_context::~decode_context() = default;

    std::unique_ptr<chunk_reader> decode_context::open(const chunk_header& h) {
        return open_payload(m_stream, h);
    }

    child_iterator decode_context::children(const chunk_header& h) {
        return child_iterator(m_stream, h, m_options);
    }

    std::vector<chunk_header> decode_context::read_children(const chunk_header& h) {
        return munge::read_children(m_stream, h, m_options);
    }

    decode_context::depth_guard decode_context::enter(const chunk_header& h) {
        THROW_PARSE_IF(m_depth >= m_options.max_depth,
                       "Maximum nesting depth ", m_options.max_depth, " exceeded at chunk ",
                       h.name, " (offset ", h.header_offset(), ")");
        ++m_depth;
        return depth_guard(*this);
    }

} // namespace munge
