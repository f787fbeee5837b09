//
// chunk encoding and decoding
//

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>
#include "input.hh"
#include "checksum.hh"
#include "utf8.hh"

#include <iomanip>
#include <limits>
#include <utility>

namespace pngme {

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data)) {
    }

    chunk::chunk(chunk_type type, std::string_view text)
        : m_type(type)
        , m_data(reinterpret_cast<const std::byte*>(text.data()),
                 reinterpret_cast<const std::byte*>(text.data()) + text.size()) {
    }

    chunk chunk::parse(const std::vector<std::byte>& data) {
        return parse(data.data(), data.size());
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        byte_reader in(static_cast<const std::byte*>(data), size);

        THROW_PARSE_IF(size < overhead, truncated,
                       "Chunk header needs at least ", overhead, " bytes, got ", size);

        const auto length = in.read<std::uint32_t>(byte_order::big);
        const chunk_type type = in.read_chunk_type();

        // Compare in 64 bits so a huge declared length cannot wrap
        const std::uint64_t needed = static_cast<std::uint64_t>(length) + overhead;
        THROW_PARSE_IF(needed > size, truncated,
                       "Chunk '", type, "' declares ", length, " data bytes and needs ", needed,
                       " bytes in total, but only ", size, " are available");

        std::vector<std::byte> payload = in.read_exact(length);
        const auto declared_crc = in.read<std::uint32_t>(byte_order::big);

        chunk result(type, std::move(payload));
        const std::uint32_t actual_crc = result.crc();
        if (actual_crc != declared_crc) {
            THROW_PARSE(crc_mismatch,
                        "CRC mismatch in chunk '", type, "': declared 0x", std::hex, std::setfill('0'),
                        std::setw(8), declared_crc, ", computed 0x", std::setw(8), actual_crc);
        }
        return result;
    }

    std::uint32_t chunk::length() const {
        THROW_SIZE_IF(m_data.size() > std::numeric_limits<std::uint32_t>::max(),
                      "Chunk '", m_type, "' payload of ", m_data.size(),
                      " bytes does not fit in the 32-bit length field");
        return static_cast<std::uint32_t>(m_data.size());
    }

    std::uint32_t chunk::crc() const {
        return chunk_crc(m_type, m_data.data(), m_data.size());
    }

    std::uint64_t chunk::serialized_size() const {
        return static_cast<std::uint64_t>(length()) + overhead;
    }

    std::string chunk::data_as_string() const {
        if (auto bad = find_invalid_utf8(m_data.data(), m_data.size())) {
            THROW_ENCODING("Chunk '", m_type, "' payload is not valid UTF-8: invalid sequence at byte offset ",
                           *bad, " (byte=0x", std::hex, std::setfill('0'), std::setw(2),
                           static_cast<unsigned>(m_data[*bad]), ")");
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::serialize() const {
        const std::uint32_t len = length();

        byte_writer out;
        out.reserve(static_cast<std::size_t>(len) + overhead);
        out.write<std::uint32_t>(len, byte_order::big);
        out.write_chunk_type(m_type);
        out.write(m_data.data(), m_data.size());
        out.write<std::uint32_t>(crc(), byte_order::big);
        return out.release();
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        return os << c.data_as_string();
    }

} // namespace pngme
