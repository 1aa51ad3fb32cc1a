//
// Created by igor on 13/08/2025.
//

#include <pngstash/chunk_iterator.hh>
#include <pngstash/png.hh>
#include <pngstash/exceptions.hh>
#include <algorithm>
#include "input.hh"

namespace pngstash {

    chunk_iterator::chunk_iterator(const std::byte* data, std::size_t size, const parse_options& options)
        : m_reader(std::make_unique<reader>(data, size))
        , m_options(options) {
        const auto& sig = png::standard_signature;
        if (size < sig.size()) {
            THROW_SIGNATURE("Invalid PNG signature: buffer holds only ", size, " bytes, signature needs ",
                            sig.size());
        }
        bool matches = std::equal(sig.begin(), sig.end(), data, [](std::uint8_t expected, std::byte actual) {
            return expected == static_cast<std::uint8_t>(actual);
        });
        if (!matches) {
            THROW_SIGNATURE("Invalid PNG signature: first 8 bytes do not match 137 80 78 71 13 10 26 10");
        }
        m_reader->skip(sig.size());

        if (!read_next_chunk()) {
            finish();
        }
    }

    chunk_iterator::chunk_iterator(const std::vector<std::byte>& bytes, const parse_options& options)
        : chunk_iterator(bytes.data(), bytes.size(), options) {
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::next() {
        if (at_end()) {
            return;
        }

        m_current.reset();
        if (!read_next_chunk()) {
            finish();
        }
    }

    std::uint64_t chunk_iterator::offset() const {
        return m_reader->tell();
    }

    bool chunk_iterator::read_next_chunk() {
        if (m_reader->remaining() == 0) {
            return false;
        }

        std::uint64_t start_pos = m_reader->tell();
        THROW_TRUNCATED_IF(m_reader->remaining() < chunk::overhead,
                           "Truncated chunk at offset ", start_pos, ": ", m_reader->remaining(),
                           " bytes left, a chunk needs at least ", chunk::overhead);

        auto length = m_reader->peek<std::uint32_t>(byte_order::big);
        auto type = chunk_type::from_bytes(m_reader->current() + 4);
        std::uint64_t total = std::uint64_t(length) + chunk::overhead;
        THROW_TRUNCATED_IF(total > m_reader->remaining(),
                           "Truncated chunk '", type, "' at offset ", start_pos, ": declares ", length,
                           " data bytes but only ", m_reader->remaining(), " bytes remain in the file");
        THROW_LENGTH_MISMATCH_IF(length > m_options.max_chunk_size,
                                 "Chunk '", type, "' at offset ", start_pos, " declares length ", length,
                                 " which exceeds the maximum of ", m_options.max_chunk_size);

        auto decoded = chunk::decode(m_reader->current(), static_cast<std::size_t>(total), m_options, start_pos);
        m_reader->skip(static_cast<std::size_t>(total));

        if (m_end_marker_seen && m_options.on_warning) {
            m_options.on_warning(start_pos, "trailing_chunk",
                                 build_error_msg("Chunk '", decoded.type(), "' follows the ",
                                                 png::end_marker, " chunk"));
        }
        m_last_was_end_marker = decoded.type() == png::end_marker;
        m_end_marker_seen = m_end_marker_seen || m_last_was_end_marker;

        m_current = chunk_info{std::move(decoded), start_pos, m_count++};
        return true;
    }

    void chunk_iterator::finish() {
        if (m_last_was_end_marker) {
            return;
        }

        if (m_options.require_end_marker) {
            THROW_PARSE("PNG file does not end with an ", png::end_marker, " chunk (", m_count,
                        " chunks decoded)");
        }
        if (m_options.on_warning) {
            m_options.on_warning(m_reader->tell(), "end_marker",
                                 build_error_msg("Last chunk is not ", png::end_marker));
        }
    }

} // namespace pngstash
