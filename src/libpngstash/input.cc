//
// Created by igor on 12/08/2025.
//

#include <algorithm>

#include "input.hh"

namespace pngstash {
    reader::reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        THROW_TRUNCATED_IF(data == nullptr && size != 0, "Null buffer of size ", size);
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }

        size = std::min(size, remaining());
        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void reader::seek(std::size_t offset) {
        THROW_TRUNCATED_IF(offset > m_size, "Cannot seek to offset ", offset,
                           " - buffer size is only ", m_size, " bytes");
        m_position = offset;
    }

    void reader::skip(std::size_t size) {
        THROW_TRUNCATED_IF(size > remaining(), "Cannot skip ", size, " bytes at offset ", m_position,
                           " - only ", remaining(), " bytes remain");
        m_position += size;
    }

    chunk_type reader::read_chunk_type() {
        THROW_TRUNCATED_IF(remaining() < 4, "Failed to read chunk type at offset ", m_position);
        chunk_type result = chunk_type::from_bytes(current());
        m_position += 4;
        return result;
    }
}
