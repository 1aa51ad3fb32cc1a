//
// Created by igor on 14/08/2025.
//

#include <algorithm>
#include <limits>
#include <zlib.h>

#include "checksum.hh"

namespace pngstash {
    std::uint32_t crc_update(std::uint32_t crc, const std::byte* data, std::size_t size, std::size_t piece) {
        piece = std::min<std::size_t>(piece, std::numeric_limits<uInt>::max());
        uLong value = crc;
        while (size > 0) {
            std::size_t n = std::min(size, piece);
            value = crc32(value, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(n));
            data += n;
            size -= n;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type.bytes().data(), 4);
        return crc_update(static_cast<std::uint32_t>(crc), data, size);
    }
}
