/**
 * @file container.hh
 * @brief Signature-prefixed ordered sequence of chunks
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <ostream>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class container
     * @brief A whole file: 8-byte signature followed by chunks in order
     *
     * Chunk order is the on-disk order and is preserved by every operation.
     * Several chunks may share a type code.
     */
    class PNGME_EXPORT container {
    public:
        /// Fixed signature at the start of every serialized container
        static constexpr std::array<std::uint8_t, 8> signature = {
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        using const_iterator = std::vector<chunk>::const_iterator;

        container() = default;
        explicit container(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete serialized container
         * @param data Whole buffer, signature included
         * @param size Buffer size in bytes
         * @param options Parse options
         * @throws parse_error on bad signature, truncation, CRC mismatch or size limit
         * @throws invalid_type_code if a chunk type contains non-letter bytes
         *
         * Parsing is all-or-nothing: the first failing chunk aborts the parse.
         */
        static container parse(const std::byte* data, std::size_t size, const parse_options& options = {});
        static container parse(const std::vector<std::byte>& data, const parse_options& options = {});

        /// Add a chunk at the end
        void append(chunk c);

        /**
         * @brief Find the first chunk with the given type text
         * @return Pointer into the container, or nullptr if no chunk matches.
         *         Invalidated by append() and remove_first_by_type().
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Remove and return the first chunk with the given type text
         * @throws not_found_error if no chunk matches; the container is unchanged
         */
        chunk remove_first_by_type(std::string_view type);

        /// Signature followed by every chunk's serialized form
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Render every chunk's payload as text, one line per chunk
         * @throws encoding_error if any payload is not valid UTF-8
         */
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }

        [[nodiscard]] const_iterator begin() const { return m_chunks.begin(); }
        [[nodiscard]] const_iterator end() const { return m_chunks.end(); }

        bool operator==(const container& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const container& o) const { return !(*this == o); }

    private:
        std::vector<chunk> m_chunks;
    };

    // Same text as container::to_string()
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const container& c);

} // namespace pngme
