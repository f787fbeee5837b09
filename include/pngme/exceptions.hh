/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every failure of a core operation
 * is reported by throwing one of these types; nothing is logged or
 * recovered internally.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <string_view>

namespace pngme {

    /**
     * @class error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pngme-specific error with a single catch block.
     */
    class error : public std::runtime_error {
    public:
        explicit error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class invalid_type_code
     * @brief Thrown when a chunk type code cannot be constructed
     *
     * Raised for type codes containing bytes that are not ASCII letters,
     * and for textual type codes whose byte length is not exactly 4.
     */
    class invalid_type_code : public error {
    public:
        explicit invalid_type_code(const std::string& msg)
            : error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for container and chunk decoding failures
     *
     * The failure cause is available through kind(), so callers can branch
     * on it without inspecting the message text.
     */
    class parse_error : public error {
    public:
        /**
         * @enum kind_t
         * @brief Closed set of decoding failure causes
         */
        enum class kind_t {
            bad_signature, ///< Buffer does not start with the 8-byte signature
            truncated,     ///< Fewer bytes available than the chunk declares
            crc_mismatch,  ///< Declared CRC differs from the computed one
            size_limit     ///< Declared length exceeds parse_options::max_chunk_size
        };

        parse_error(kind_t k, const std::string& msg)
            : error(msg), m_kind(k) {}

        [[nodiscard]] kind_t kind() const noexcept { return m_kind; }

    private:
        kind_t m_kind;
    };

    /**
     * @class encoding_error
     * @brief Thrown when a payload is requested as text but is not UTF-8
     */
    class encoding_error : public error {
    public:
        explicit encoding_error(const std::string& msg)
            : error(msg) {}
    };

    /**
     * @class not_found_error
     * @brief Thrown when no chunk of the requested type exists
     */
    class not_found_error : public error {
    public:
        explicit not_found_error(const std::string& msg)
            : error(msg) {}
    };

    /**
     * @class size_error
     * @brief Thrown when a payload is too large for the 32-bit length field
     */
    class size_error : public error {
    public:
        explicit size_error(const std::string& msg)
            : error(msg) {}
    };

    /**
     * @brief Get printable name of a parse failure cause
     * @param k Failure cause
     * @return Lowercase name, e.g. "crc_mismatch"
     */
    inline std::string_view to_string(parse_error::kind_t k) {
        switch (k) {
            case parse_error::kind_t::bad_signature:
                return "bad_signature";
            case parse_error::kind_t::truncated:
                return "truncated";
            case parse_error::kind_t::crc_mismatch:
                return "crc_mismatch";
            case parse_error::kind_t::size_limit:
                return "size_limit";
        }
        return "unknown";
    }

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given kind with formatted message
     * @param KIND Enumerator of parse_error::kind_t (unqualified)
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(KIND, ...) \
        throw ::pngme::parse_error(::pngme::parse_error::kind_t::KIND, ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, KIND, ...) \
        do { if (condition) THROW_PARSE(KIND, __VA_ARGS__); } while(0)

    /**
     * @def THROW_TYPE_CODE
     * @brief Throw an invalid_type_code with formatted message
     */
    #define THROW_TYPE_CODE(...) \
        throw ::pngme::invalid_type_code(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_ENCODING
     * @brief Throw an encoding_error with formatted message
     */
    #define THROW_ENCODING(...) \
        throw ::pngme::encoding_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_NOT_FOUND
     * @brief Throw a not_found_error with formatted message
     */
    #define THROW_NOT_FOUND(...) \
        throw ::pngme::not_found_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_SIZE_IF
     * @brief Conditionally throw a size_error
     */
    #define THROW_SIZE_IF(condition, ...) \
        do { if (condition) throw ::pngme::size_error(::pngme::build_error_msg(__VA_ARGS__)); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
