/**
 * @file chunk_iterator.hh
 * @brief Forward cursor over the chunks of an in-memory PNG file
 * @author Igor
 * @date 13/08/2025
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <pngstash/chunk.hh>
#include <pngstash/parse_options.hh>
#include <pngstash/export_pngstash.h>

namespace pngstash {

    class reader;

    /**
     * @class chunk_iterator
     * @brief Decodes the chunks of a PNG buffer one at a time
     *
     * The signature is checked on construction. Each step decodes the
     * next chunk with the same rules as chunk::decode; any failure is
     * thrown from the constructor or from next(). The buffer must
     * outlive the iterator.
     */
    class PNGSTASH_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief The current chunk and where it was found
         */
        struct chunk_info {
            chunk value;              ///< Decoded chunk
            std::uint64_t offset;     ///< Offset of the chunk's length field in the buffer
            std::size_t index;        ///< Position in the chunk sequence (0 = first)
        };

        /**
         * @brief Start iterating a PNG buffer
         * @param data Pointer to the first signature byte
         * @param size Buffer size
         * @param options Decoding options
         * @throws invalid_signature_error if the buffer does not start with the PNG signature
         */
        chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options = {});

        explicit chunk_iterator(const std::vector<std::byte>& bytes, const parse_options& options = {});

        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator=(const chunk_iterator&) = delete;

        /**
         * @brief Current chunk; only valid while has_next() is true
         */
        [[nodiscard]] const chunk_info& current() const { return m_current.value(); }

        /**
         * @brief Advance to the next chunk
         */
        void next();

        [[nodiscard]] bool has_next() const { return m_current.has_value(); }
        [[nodiscard]] bool at_end() const { return !m_current.has_value(); }

        /**
         * @brief Offset of the next unread byte
         */
        [[nodiscard]] std::uint64_t offset() const;

    private:
        bool read_next_chunk();
        void finish();

        std::unique_ptr<reader> m_reader;
        parse_options m_options;
        std::optional<chunk_info> m_current;
        std::size_t m_count = 0;
        bool m_end_marker_seen = false;
        bool m_last_was_end_marker = false;
    };

} // namespace pngstash
