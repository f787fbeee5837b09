/**
 * @file chunk.hh
 * @brief A single length-prefixed, typed, CRC-protected record
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <ostream>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief One record of the container format
     *
     * Wire layout:
     * @code
     *   [4-byte big-endian length L][4-byte type][L data bytes][4-byte big-endian CRC]
     * @endcode
     * The CRC is CRC-32/ISO-HDLC over the type bytes followed by the data.
     * Length and CRC are always computed from the payload, never stored.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Bytes taken by the length, type and CRC fields around the payload
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Create a chunk from a type and an owned payload
         *
         * Always succeeds. Payloads longer than UINT32_MAX bytes are accepted
         * here but cannot be measured or serialized (see length()).
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Create a chunk whose payload is a copy of the given text
         */
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Decode one chunk from the start of a buffer
         * @param data Buffer starting at the chunk's length field
         * @param size Number of readable bytes
         * @return The decoded chunk; it occupies serialized_size() bytes
         * @throws parse_error (truncated) if the buffer is shorter than 12 + L bytes
         * @throws parse_error (crc_mismatch) if the declared CRC is wrong
         * @throws invalid_type_code if the type bytes are not ASCII letters
         *
         * Bytes following the chunk are not examined.
         */
        static chunk parse(const void* data, std::size_t size);
        static chunk parse(const std::vector<std::byte>& data);

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        /**
         * @brief Payload length as stored in the length field
         * @throws size_error if the payload does not fit in 32 bits
         */
        [[nodiscard]] std::uint32_t length() const;

        /// CRC-32 of type bytes followed by the payload
        [[nodiscard]] std::uint32_t crc() const;

        /// Total encoded size: 12 + length()
        [[nodiscard]] std::uint64_t serialized_size() const;

        /**
         * @brief Interpret the payload as UTF-8 text
         * @throws encoding_error if the payload is not well-formed UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Encode to the wire layout
         * @throws size_error if the payload does not fit in 32 bits
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
    };

    // Writes the payload text; throws encoding_error for binary payloads
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
