//
// CRC-32/ISO-HDLC chunk checksum backed by zlib
//

#pragma once

#include <cstdint>
#include <cstddef>

#include <pngme/chunk_type.hh>

namespace pngme {

    // CRC of type code followed by payload, as stored in a chunk trailer
    std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size);

}
