//
// handler_registry implementation
//

#include <pngme/handler_registry.hh>

#include <utility>

namespace pngme {

    void handler_registry::on_chunk(chunk_type id, chunk_handler handler) {
        m_type_handlers[id].push_back(std::move(handler));
    }

    void handler_registry::on_any_chunk(chunk_handler handler) {
        m_any_handlers.push_back(std::move(handler));
    }

    void handler_registry::emit(const chunk_event& event) const {
        // Type-specific handlers first
        auto it = m_type_handlers.find(event.header.id);
        if (it != m_type_handlers.end()) {
            for (const auto& handler : it->second) {
                handler(event);
            }
        }

        for (const auto& handler : m_any_handlers) {
            handler(event);
        }
    }

    bool handler_registry::empty() const {
        return m_type_handlers.empty() && m_any_handlers.empty();
    }

} // namespace pngme
