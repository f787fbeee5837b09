/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for chunk containers
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing a container buffer
     *
     * Controls strictness, size limits and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, an incomplete chunk at the end of the buffer is a
         * parse_error (truncated). When false, those trailing bytes are
         * reported through on_warning ("trailing_data") and ignored.
         * CRC mismatches and invalid type codes are fatal in both modes.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload size in bytes
         *
         * Chunks declaring a larger length throw parse_error (size_limit).
         * The default admits every length the 32-bit field can express.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where the warning occurred
         * @param category Warning category ("reserved_bit", "trailing_data", "after_iend")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
