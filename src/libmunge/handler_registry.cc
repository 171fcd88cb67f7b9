//
// Created by igor on 14/08/2025.
//

#include <munge/handler_registry.hh>
#include <utility>
#include <vector>

namespace munge {

    void handler_registry::on_chunk(const chunk_name& name, chunk_handler handler) {
        if (const auto* t = std::get_if<tag>(&name)) {
            tag_handlers_.emplace(*t, std::move(handler));
        } else {
            hashed_handlers_.emplace(std::get<hashed_name>(name).value, std::move(handler));
        }
    }

    void handler_registry::on_unknown(chunk_handler handler) {
        unknown_handler_ = std::move(handler);
    }

    bool handler_registry::emit(const chunk_event& event) const {
        std::vector<const chunk_handler*> handlers_to_call;

        // Literal handlers first
        auto range = tag_handlers_.equal_range(event.header.name);
        for (auto it = range.first; it != range.second; ++it) {
            handlers_to_call.push_back(&it->second);
        }

        auto hashed = hashed_handlers_.equal_range(event.header.name.to_uint32());
        for (auto it = hashed.first; it != hashed.second; ++it) {
            handlers_to_call.push_back(&it->second);
        }

        if (handlers_to_call.empty()) {
            if (unknown_handler_) {
                unknown_handler_(event);
            }
            return false;
        }

        for (const auto* handler : handlers_to_call) {
            (*handler)(event);
        }
        return true;
    }

} // namespace munge
