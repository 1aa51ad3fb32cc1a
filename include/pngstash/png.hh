/**
 * @file png.hh
 * @brief PNG file container: signature plus ordered chunk sequence
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <iosfwd>
#include <array>
#include <vector>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngstash/export_pngstash.h>
#include <pngstash/chunk.hh>
#include <pngstash/chunk_type.hh>
#include <pngstash/parse_options.hh>

namespace pngstash {

    /**
     * @class png
     * @brief A whole PNG file held as a sequence of chunks
     *
     * Pixel data is never interpreted. Chunk order is preserved exactly;
     * append_chunk() keeps an IEND chunk, if present, at the end.
     */
    class PNGSTASH_EXPORT png {
    public:
        using signature_t = std::array<std::uint8_t, 8>;

        /// The 8 bytes every PNG file starts with
        static constexpr signature_t standard_signature{137, 80, 78, 71, 13, 10, 26, 10};

        /// Type of the conventional terminal chunk
        static constexpr chunk_type end_marker = chunk_types::IEND;

        /**
         * @brief Empty container (signature only)
         */
        png() = default;

        /**
         * @brief Container holding the given chunks in order
         */
        explicit png(std::vector<chunk> chunks);

        static png from_chunks(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG file
         *
         * Either every chunk decodes or the whole operation fails.
         *
         * @throws invalid_signature_error if the first 8 bytes are not the PNG signature
         * @throws truncated_input_error if a chunk runs past the end of the buffer
         * @throws length_mismatch_error, checksum_mismatch_error from chunk decoding
         * @throws parse_error if options.require_end_marker is set and IEND is missing
         */
        static png decode(const std::byte* data, std::size_t size, const parse_options& options = {});

        static png decode(const std::vector<std::byte>& bytes, const parse_options& options = {});

        /**
         * @brief Serialize signature followed by every chunk
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Insert a chunk before the first IEND chunk, or at the end if there is none
         */
        void append_chunk(chunk c);

        /**
         * @brief Remove and return the first chunk of the given type
         * @throws not_found_error if no chunk has that type
         */
        chunk remove_chunk(const chunk_type& type);

        /**
         * @brief Same as remove_chunk(const chunk_type&), type given as text
         * @throws format_error if the text is not a chunk type
         */
        chunk remove_chunk(std::string_view type);

        /**
         * @brief First chunk of the given type
         * @return Pointer into the container, or nullptr if none match
         */
        [[nodiscard]] const chunk* chunk_by_type(const chunk_type& type) const;

        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Every chunk of the given type, in order
         */
        [[nodiscard]] std::vector<const chunk*> chunks_by_type(const chunk_type& type) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] const signature_t& signature() const { return standard_signature; }

        /// Size of the encoded file in bytes
        [[nodiscard]] std::size_t total_size() const;

    private:
        std::vector<chunk> m_chunks;
    };

    /**
     * @brief Print the signature followed by one chunk per line
     */
    PNGSTASH_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngstash
