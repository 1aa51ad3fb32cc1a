/**
 * @file parse_options.hh
 * @brief Decoding options for PNG chunks and files
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngstash {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding chunks and PNG files
     *
     * A default-constructed instance accepts any structurally sound file:
     * chunk types are not checked for validity and the end marker is optional.
     */
    struct parse_options {
        /**
         * @brief Reject chunks whose type is not valid
         *
         * When true, a chunk whose type fails chunk_type::is_valid()
         * raises format_error. The check runs after the checksum has
         * been verified. When false, such chunks are kept and a
         * "chunk_type" warning is emitted.
         */
        bool validate_chunk_types = false;

        /**
         * @brief Require the last chunk to be IEND
         *
         * When true, png::decode fails with parse_error if the file does
         * not end with an IEND chunk. When false, an "end_marker" warning
         * is emitted instead.
         */
        bool require_end_marker = false;

        /**
         * @brief Maximum allowed declared chunk length in bytes
         *
         * Default is 2^31 - 1, the largest length the PNG format permits.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset of the chunk inside the buffer
         * @param category Warning category ("chunk_type", "end_marker", "trailing_chunk")
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
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngstash
