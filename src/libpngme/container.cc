//
// container parsing, editing and serialization
//

#include <pngme/container.hh>
#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>
#include "input.hh"

#include <algorithm>
#include <utility>

namespace pngme {

    container::container(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    container container::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    container container::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        std::vector<chunk> chunks;

        chunk_iterator it(data, size, options);
        while (it.has_next()) {
            chunks.push_back(std::move(it.current().value));
            it.next();
        }

        return container(std::move(chunks));
    }

    void container::append(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    const chunk* container::chunk_by_type(std::string_view type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    chunk container::remove_first_by_type(std::string_view type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type() == type;
        });
        if (it == m_chunks.end()) {
            THROW_NOT_FOUND("No chunk of type '", type, "' in container of ", m_chunks.size(), " chunks");
        }

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::vector<std::byte> container::serialize() const {
        // serialized_size() throws for oversized payloads before anything is written
        std::uint64_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.serialized_size();
        }

        byte_writer out;
        out.reserve(static_cast<std::size_t>(total));
        out.write(signature.data(), signature.size());
        for (const auto& c : m_chunks) {
            const auto bytes = c.serialize();
            out.write(bytes.data(), bytes.size());
        }
        return out.release();
    }

    std::string container::to_string() const {
        std::string text;
        for (std::size_t i = 0; i < m_chunks.size(); i++) {
            if (i > 0) {
                text += '\n';
            }
            text += m_chunks[i].data_as_string();
        }
        return text;
    }

    std::ostream& operator<<(std::ostream& os, const container& c) {
        return os << c.to_string();
    }

} // namespace pngme
