//
// chunk_type construction and validation
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <iomanip>

namespace pngme {

    namespace {
        // Render offending bytes as hex so non-printable input stays readable
        std::string describe_bytes(const char* data, std::size_t size) {
            std::ostringstream oss;
            oss << std::hex << std::setfill('0');
            for (std::size_t i = 0; i < size; i++) {
                if (i > 0) {
                    oss << ' ';
                }
                oss << std::setw(2) << static_cast<unsigned>(static_cast<unsigned char>(data[i]));
            }
            return oss.str();
        }
    }

    chunk_type chunk_type::from_bytes(const std::array<std::uint8_t, 4>& bytes) {
        return from_bytes(static_cast<const void*>(bytes.data()));
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        const char* p = static_cast<const char*>(data);
        for (std::size_t i = 0; i < 4; i++) {
            if (!is_ascii_alpha(p[i])) {
                THROW_TYPE_CODE("Chunk type can only contain ASCII letters (A-Z, a-z), got bytes [",
                                describe_bytes(p, 4), "] with invalid byte at position ", i);
            }
        }
        return {p[0], p[1], p[2], p[3]};
    }

    chunk_type chunk_type::from_string(std::string_view text) {
        if (text.size() != 4) {
            THROW_TYPE_CODE("Chunk type must be exactly 4 bytes long, got ", text.size(),
                            " bytes");
        }
        return from_bytes(static_cast<const void*>(text.data()));
    }

} // namespace pngme
