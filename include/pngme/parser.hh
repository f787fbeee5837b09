/**
 * @file parser.hh
 * @brief Callback-driven walking of container buffers
 */

#pragma once

#include <cstddef>
#include <vector>

#include <pngme/handler_registry.hh>
#include <pngme/chunk_iterator.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @brief Parse a buffer with handler registry and custom options
     *
     * Walks every chunk of the buffer and emits one event per chunk to the
     * registered handlers. Errors propagate from the iterator unchanged;
     * handlers already called for earlier chunks are not rolled back.
     *
     * @param data Buffer beginning with the container signature
     * @param size Buffer size in bytes
     * @param handlers Registry of event handlers to process chunks
     * @param options Parse options for controlling parsing behavior
     */
    inline void parse(const std::byte* data, std::size_t size, const handler_registry& handlers,
                      const parse_options& options) {
        chunk_iterator it(data, size, options);

        while (it.has_next()) {
            const auto& info = it.current();
            handlers.emit(chunk_event(info.header, info.value, info.index));
            it.next();
        }
    }

    inline void parse(const std::byte* data, std::size_t size, const handler_registry& handlers) {
        parse(data, size, handlers, parse_options{});
    }

    inline void parse(const std::vector<std::byte>& data, const handler_registry& handlers,
                      const parse_options& options = {}) {
        parse(data.data(), data.size(), handlers, options);
    }

    /**
     * @brief Simple functional interface for iterating chunks
     *
     * Calls the provided function for each chunk in the buffer.
     *
     * @tparam Func Callable type accepting chunk_iterator::chunk_info&
     * @param data Buffer beginning with the container signature
     * @param size Buffer size in bytes
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(const std::byte* data, std::size_t size, Func func, const parse_options& options) {
        chunk_iterator it(data, size, options);

        while (it.has_next()) {
            func(it.current());
            it.next();
        }
    }

    template<typename Func>
    void for_each_chunk(const std::byte* data, std::size_t size, Func func) {
        for_each_chunk(data, size, func, parse_options{});
    }

    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& data, Func func, const parse_options& options = {}) {
        for_each_chunk(data.data(), data.size(), func, options);
    }

} // namespace pngme
