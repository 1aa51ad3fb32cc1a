/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngstash library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every decode failure derives
 * from parse_error, so callers that do not care about the exact stage
 * can catch a single type.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <cstdint>

namespace pngstash {

    /**
     * @class pngstash_error
     * @brief Base exception class for all pngstash errors
     */
    class pngstash_error : public std::runtime_error {
    public:
        explicit pngstash_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for file access errors
     *
     * The library core never touches the filesystem; this is thrown by
     * the tools that load and store PNG files.
     */
    class io_error : public pngstash_error {
    public:
        explicit io_error(const std::string& msg)
            : pngstash_error(msg) {}
    };

    /**
     * @class format_error
     * @brief Malformed chunk type text or bytes, or chunk data that is not text
     */
    class format_error : public pngstash_error {
    public:
        explicit format_error(const std::string& msg)
            : pngstash_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base class for errors raised while decoding chunks or PNG files
     */
    class parse_error : public pngstash_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngstash_error(msg) {}
    };

    /**
     * @class truncated_input_error
     * @brief Buffer is shorter than the structure it must contain
     */
    class truncated_input_error : public parse_error {
    public:
        explicit truncated_input_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class length_mismatch_error
     * @brief Declared chunk length is inconsistent with the available bytes
     */
    class length_mismatch_error : public parse_error {
    public:
        explicit length_mismatch_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class checksum_mismatch_error
     * @brief Stored CRC-32 does not match the CRC-32 of type and data
     */
    class checksum_mismatch_error : public parse_error {
    public:
        checksum_mismatch_error(const std::string& msg, std::uint32_t stored, std::uint32_t computed)
            : parse_error(msg), m_stored(stored), m_computed(computed) {}

        [[nodiscard]] std::uint32_t stored() const noexcept { return m_stored; }
        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }

    private:
        std::uint32_t m_stored;
        std::uint32_t m_computed;
    };

    /**
     * @class invalid_signature_error
     * @brief Buffer does not start with the 8 byte PNG signature
     */
    class invalid_signature_error : public parse_error {
    public:
        explicit invalid_signature_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class not_found_error
     * @brief No chunk of the requested type is present
     */
    class not_found_error : public pngstash_error {
    public:
        explicit not_found_error(const std::string& msg)
            : pngstash_error(msg) {}
    };

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

    #define THROW_IO(...) \
        throw ::pngstash::io_error(::pngstash::build_error_msg(__VA_ARGS__))

    #define THROW_FORMAT(...) \
        throw ::pngstash::format_error(::pngstash::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE(...) \
        throw ::pngstash::parse_error(::pngstash::build_error_msg(__VA_ARGS__))

    #define THROW_TRUNCATED(...) \
        throw ::pngstash::truncated_input_error(::pngstash::build_error_msg(__VA_ARGS__))

    #define THROW_LENGTH_MISMATCH(...) \
        throw ::pngstash::length_mismatch_error(::pngstash::build_error_msg(__VA_ARGS__))

    #define THROW_SIGNATURE(...) \
        throw ::pngstash::invalid_signature_error(::pngstash::build_error_msg(__VA_ARGS__))

    #define THROW_NOT_FOUND(...) \
        throw ::pngstash::not_found_error(::pngstash::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_FORMAT_UNLESS
     * @brief Throw a format_error unless condition is true
     */
    #define THROW_FORMAT_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_FORMAT(__VA_ARGS__); } while(0)

    /**
     * @def THROW_TRUNCATED_IF
     * @brief Conditionally throw a truncated_input_error
     */
    #define THROW_TRUNCATED_IF(condition, ...) \
        do { if (condition) THROW_TRUNCATED(__VA_ARGS__); } while(0)

    /**
     * @def THROW_LENGTH_MISMATCH_IF
     * @brief Conditionally throw a length_mismatch_error
     */
    #define THROW_LENGTH_MISMATCH_IF(condition, ...) \
        do { if (condition) THROW_LENGTH_MISMATCH(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngstash
