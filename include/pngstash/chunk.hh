/**
 * @file chunk.hh
 * @brief A single PNG chunk: length, type, data and CRC-32
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngstash/export_pngstash.h>
#include <pngstash/chunk_type.hh>
#include <pngstash/parse_options.hh>

namespace pngstash {

    /**
     * @class chunk
     * @brief One length-prefixed, checksummed unit of a PNG file
     *
     * On the wire a chunk is: length (4 bytes, big-endian), type (4 bytes),
     * data (length bytes), CRC-32 of type and data (4 bytes, big-endian).
     * A chunk is immutable once built; its CRC is always consistent with
     * its type and data.
     */
    class PNGSTASH_EXPORT chunk {
    public:
        /// Length field + type + CRC
        static constexpr std::size_t overhead = 12;

        /// Largest payload the 32-bit length field can describe
        static constexpr std::uint64_t max_length = 0xFFFFFFFFu;

        /**
         * @brief Build a chunk and compute its CRC
         * @param type Chunk type, stored as given (validity is not checked)
         * @param data Chunk payload
         * @throws length_mismatch_error if data holds more than max_length bytes
         */
        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk from a type text and a text payload
         * @throws format_error if the type text is not 4 ASCII letters
         */
        static chunk from_text(std::string_view type, std::string_view message);

        /**
         * @brief Decode a chunk occupying exactly the given bytes
         *
         * The buffer must hold exactly 12 + length bytes. The stored CRC
         * is verified, never trusted.
         *
         * @param data Pointer to the first byte of the length field
         * @param size Number of bytes available
         * @param options Decoding options
         * @param offset Position of the chunk in the enclosing file, used in diagnostics
         * @throws truncated_input_error if fewer than 12 bytes are given
         * @throws length_mismatch_error if size != 12 + declared length
         * @throws checksum_mismatch_error if the CRC does not verify
         * @throws format_error if options.validate_chunk_types rejects the type
         */
        static chunk decode(const std::byte* data, std::size_t size,
                            const parse_options& options = {}, std::uint64_t offset = 0);

        static chunk decode(const std::vector<std::byte>& bytes, const parse_options& options = {});

        /**
         * @brief Serialize to length + type + data + CRC
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Append the serialized chunk to an existing buffer
         */
        void encode_to(std::vector<std::byte>& out) const;

        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Number of bytes the chunk occupies in a file
        [[nodiscard]] std::size_t total_size() const { return overhead + m_data.size(); }

        /**
         * @brief Interpret the payload as UTF-8 text
         * @throws format_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_text() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc);

        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    /**
     * @brief Print length, type (text and bytes), data bytes and CRC
     */
    PNGSTASH_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngstash
