//
// Created by igor on 14/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>

#include <pngstash/chunk_type.hh>

namespace pngstash {
    // Continue a zlib CRC-32 over data, feeding at most piece bytes per call (capped at uInt)
    std::uint32_t crc_update(std::uint32_t crc, const std::byte* data, std::size_t size,
                             std::size_t piece = static_cast<std::size_t>(-1));

    // CRC-32 (zlib/PNG polynomial) over type bytes followed by data bytes
    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size);
}
