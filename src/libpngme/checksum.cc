//
// CRC-32/ISO-HDLC chunk checksum backed by zlib
//

#include "checksum.hh"

#include <array>
#include <zlib.h>

namespace pngme {

    std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size) {
        std::array<char, 4> code;
        type.to_bytes(code.data());

        // Running CRC over type then payload
        uLong crc = ::crc32_z(0L, Z_NULL, 0);
        crc = ::crc32_z(crc, reinterpret_cast<const Bytef*>(code.data()), code.size());
        if (size > 0) {
            crc = ::crc32_z(crc, static_cast<const Bytef*>(data), static_cast<z_size_t>(size));
        }
        return static_cast<std::uint32_t>(crc);
    }

}
