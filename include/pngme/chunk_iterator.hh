/**
 * @file chunk_iterator.hh
 * @brief Sequential walk over the chunks of an in-memory container
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/chunk_header.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class chunk_iterator
     * @brief Iterator over the chunks of a container buffer
     *
     * The constructor validates the signature and decodes the first chunk.
     * Each chunk is fully verified (type code, length, CRC) before it
     * becomes current. The buffer is not copied and must outlive the
     * iterator.
     *
     * @code
     *   pngme::chunk_iterator it(bytes.data(), bytes.size());
     *   while (it.has_next()) {
     *       std::cout << it.current().header.id << "\n";
     *       it.next();
     *   }
     * @endcode
     */
    class PNGME_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief Information about the current chunk
         */
        struct chunk_info {
            chunk_header header;  ///< Framing and position of the chunk
            chunk value;          ///< Decoded chunk
            std::size_t index;    ///< Zero-based position in the container
        };

        /**
         * @brief Start iterating a container buffer
         * @param data Buffer beginning with the 8-byte signature
         * @param size Buffer size in bytes
         * @param options Parse options
         * @throws parse_error (bad_signature) if the signature is missing
         */
        chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options = {});
        explicit chunk_iterator(const std::vector<std::byte>& data, const parse_options& options = {});

        /**
         * @brief Get current chunk information
         *
         * Only valid while has_next() is true.
         */
        const chunk_info& current() const { return *m_current; }
        chunk_info& current() { return *m_current; }

        /**
         * @brief Advance to the next chunk
         */
        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

        /// Offset of the first byte not yet consumed
        std::uint64_t offset() const { return m_position; }

    private:
        void advance();

        // Decode the chunk at m_position; false when the buffer is exhausted
        bool read_next_chunk();

        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const;

        const std::byte* m_data;
        std::size_t m_size;
        std::size_t m_position;
        std::size_t m_index;
        bool m_ended;
        bool m_seen_iend;
        parse_options m_options;
        std::optional<chunk_info> m_current;
    };

} // namespace pngme
