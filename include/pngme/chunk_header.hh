/**
 * @file chunk_header.hh
 * @brief Location and framing fields of a chunk found in a buffer
 */

#pragma once

#include <cstdint>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @struct chunk_header
     * @brief Framing information for a chunk as it appeared in the input
     */
    struct chunk_header {
        chunk_type id;                    ///< Chunk type code
        std::uint32_t length = 0;         ///< Payload size in bytes
        std::uint32_t crc = 0;            ///< Verified CRC from the chunk trailer
        std::uint64_t file_offset = 0;    ///< Absolute offset of the length field in the buffer
    };

} // namespace pngme
