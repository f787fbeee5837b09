//
// In-memory byte cursor and byte sink used by the chunk codec
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>
#include <utility>

#include <pngme/exceptions.hh>
#include <pngme/byte_order.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    // Read-only cursor over a caller-owned buffer. The buffer must outlive
    // the reader. Reading past the end throws parse_error(truncated).
    class byte_reader {
        public:
            byte_reader(const std::byte* data, std::size_t size)
                : m_data(data), m_size(size), m_position(0) {}

            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

            void read(void* dst, std::size_t count) {
                THROW_PARSE_IF(count > remaining(), truncated,
                               "Unexpected end of data at offset ", m_position, ": need ", count,
                               " bytes, ", remaining(), " available");
                if (count > 0) {
                    std::memcpy(dst, m_data + m_position, count);
                }
                m_position += count;
            }

            std::vector<std::byte> read_exact(std::size_t count) {
                std::vector<std::byte> buffer(count);
                read(buffer.data(), count);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                read(buff.data(), sizeof(T));

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            chunk_type read_chunk_type() {
                std::array<char, 4> data;
                read(data.data(), 4);
                return chunk_type::from_bytes(static_cast<const void*>(data.data()));
            }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Append-only sink that materializes a complete output buffer
    class byte_writer {
        public:
            byte_writer() = default;

            void reserve(std::size_t size) { m_buffer.reserve(size); }

            void write(const void* src, std::size_t count) {
                const auto* p = static_cast<const std::byte*>(src);
                m_buffer.insert(m_buffer.end(), p, p + count);
            }

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                write(&value, sizeof(T));
            }

            void write_chunk_type(const chunk_type& type) {
                std::array<char, 4> data;
                type.to_bytes(data.data());
                write(data.data(), 4);
            }

            [[nodiscard]] std::size_t size() const { return m_buffer.size(); }

            std::vector<std::byte> release() { return std::move(m_buffer); }

        private:
            std::vector<std::byte> m_buffer;
    };
}
