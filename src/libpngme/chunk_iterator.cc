//
// Sequential chunk decoding over a container buffer
//

#include <pngme/chunk_iterator.hh>
#include <pngme/container.hh>
#include <pngme/exceptions.hh>
#include "input.hh"

#include <algorithm>

namespace pngme {

    static constexpr auto IEND = "IEND"_type;

    chunk_iterator::chunk_iterator(const std::vector<std::byte>& data, const parse_options& options)
        : chunk_iterator(data.data(), data.size(), options) {
    }

    chunk_iterator::chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options)
        : m_data(data)
        , m_size(size)
        , m_position(0)
        , m_index(0)
        , m_ended(false)
        , m_seen_iend(false)
        , m_options(options) {

        const auto& sig = container::signature;
        if (size < sig.size()) {
            THROW_PARSE(bad_signature, "Input of ", size, " bytes is too short for the ",
                        sig.size(), "-byte signature");
        }
        const bool matches = std::equal(sig.begin(), sig.end(), data, [](std::uint8_t a, std::byte b) {
            return a == static_cast<std::uint8_t>(b);
        });
        THROW_PARSE_IF(!matches, bad_signature, "Input does not start with the container signature");

        m_position = sig.size();

        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    void chunk_iterator::advance() {
        if (m_ended) {
            return;
        }
        if (!read_next_chunk()) {
            m_ended = true;
            m_current.reset();
        }
    }

    bool chunk_iterator::read_next_chunk() {
        if (m_position >= m_size) {
            return false;
        }

        const std::size_t start = m_position;
        const std::size_t available = m_size - start;

        if (available < chunk::overhead) {
            if (m_options.strict) {
                THROW_PARSE(truncated, "Trailing ", available, " bytes at offset ", start,
                            " do not form a complete chunk header (", chunk::overhead, " bytes required)");
            }
            warn(start, "trailing_data",
                 build_error_msg("Ignoring ", available, " trailing bytes at offset ", start));
            return false;
        }

        byte_reader in(m_data + start, available);
        const auto length = in.read<std::uint32_t>(byte_order::big);
        const chunk_type id = in.read_chunk_type();

        if (length > m_options.max_chunk_size) {
            THROW_PARSE(size_limit, "Chunk '", id, "' at offset ", start, " has size ", length,
                        " bytes, which exceeds maximum allowed size of ", m_options.max_chunk_size, " bytes");
        }

        const std::uint64_t total = static_cast<std::uint64_t>(length) + chunk::overhead;
        if (total > available && !m_options.strict) {
            warn(start, "trailing_data",
                 build_error_msg("Chunk '", id, "' at offset ", start, " declares ", length,
                                 " data bytes but only ", available - chunk::overhead,
                                 " remain, ignoring trailing bytes"));
            return false;
        }

        try {
            chunk value = chunk::parse(m_data + start, available);

            if (!id.is_reserved_bit_valid()) {
                warn(start, "reserved_bit",
                     build_error_msg("Chunk '", id, "' at offset ", start,
                                     " has the reserved bit set (third letter is lowercase)"));
            }
            if (m_seen_iend) {
                warn(start, "after_iend",
                     build_error_msg("Chunk '", id, "' at offset ", start, " follows the IEND chunk"));
            }
            if (id == IEND) {
                m_seen_iend = true;
            }

            chunk_header header{id, length, value.crc(), start};
            m_current.emplace(chunk_info{header, std::move(value), m_index++});
        } catch (const parse_error& e) {
            throw parse_error(e.kind(), build_error_msg(e.what(), " (chunk at offset ", start, ")"));
        }

        m_position = start + static_cast<std::size_t>(total);
        return true;
    }

    void chunk_iterator::warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

} // namespace pngme
