/**
 * @file handler_registry.hh
 * @brief Per-type callbacks for chunks met while walking a container
 */

#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/chunk_header.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @struct chunk_event
     * @brief Event data passed to chunk handlers
     */
    struct chunk_event {
        const chunk_header& header;   ///< Framing and position of the chunk
        const chunk& value;           ///< Decoded chunk
        std::size_t index;            ///< Zero-based position in the container

        chunk_event() = delete;

        chunk_event(const chunk_header& h, const chunk& c, std::size_t i)
            : header(h), value(c), index(i) {}
    };

    /**
     * @typedef chunk_handler
     * @brief Function type for chunk event handlers
     */
    using chunk_handler = std::function<void(const chunk_event& event)>;

    /**
     * @class handler_registry
     * @brief Registry of chunk handlers
     *
     * Handlers registered for a specific chunk type run before catch-all
     * handlers. Within each group, handlers run in registration order.
     * Multiple handlers can be registered for the same chunk type.
     */
    class PNGME_EXPORT handler_registry {
    public:
        /**
         * @brief Register handler for one chunk type
         * @param id Chunk type to match (byte-for-byte, case included)
         * @param handler Handler function to call
         */
        void on_chunk(chunk_type id, chunk_handler handler);

        /**
         * @brief Register handler called for every chunk
         */
        void on_any_chunk(chunk_handler handler);

        /**
         * @brief Emit an event to all matching handlers
         */
        void emit(const chunk_event& event) const;

        /// True when no handler is registered
        [[nodiscard]] bool empty() const;

    private:
        std::unordered_map<chunk_type, std::vector<chunk_handler>> m_type_handlers;
        std::vector<chunk_handler> m_any_handlers;
    };

} // namespace pngme
