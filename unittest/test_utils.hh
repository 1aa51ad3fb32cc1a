#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <zlib.h>

// Helpers that build PNG bytes by hand, independently of the library

inline std::vector<std::byte> bytes_of(std::string_view text) {
    std::vector<std::byte> out;
    for (char c : text) {
        out.push_back(std::byte(static_cast<unsigned char>(c)));
    }
    return out;
}

inline void append_be32(std::vector<std::byte>& out, std::uint32_t v) {
    out.push_back(std::byte((v >> 24) & 0xFF));
    out.push_back(std::byte((v >> 16) & 0xFF));
    out.push_back(std::byte((v >> 8) & 0xFF));
    out.push_back(std::byte(v & 0xFF));
}

inline std::uint32_t reference_crc(std::string_view type, const std::vector<std::byte>& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(type.data()), 4);
    if (!data.empty()) {
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
    }
    return static_cast<std::uint32_t>(crc);
}

inline void append_raw_chunk(std::vector<std::byte>& out, std::string_view type,
                             const std::vector<std::byte>& data) {
    append_be32(out, static_cast<std::uint32_t>(data.size()));
    auto t = bytes_of(type);
    out.insert(out.end(), t.begin(), t.end());
    out.insert(out.end(), data.begin(), data.end());
    append_be32(out, reference_crc(type, data));
}

inline std::vector<std::byte> raw_chunk(std::string_view type, const std::vector<std::byte>& data) {
    std::vector<std::byte> out;
    append_raw_chunk(out, type, data);
    return out;
}

inline std::vector<std::byte> png_signature_bytes() {
    return {std::byte(137), std::byte(80), std::byte(78), std::byte(71),
            std::byte(13), std::byte(10), std::byte(26), std::byte(10)};
}

inline std::vector<std::byte> ihdr_data(std::uint32_t width, std::uint32_t height) {
    std::vector<std::byte> data;
    append_be32(data, width);
    append_be32(data, height);
    data.push_back(std::byte(8)); // bit depth
    data.push_back(std::byte(2)); // truecolor
    data.push_back(std::byte(0)); // compression
    data.push_back(std::byte(0)); // filter
    data.push_back(std::byte(0)); // interlace
    return data;
}

// Deflated scanlines of a width x height RGB image, filter type 0
inline std::vector<std::byte> idat_data(std::uint32_t width, std::uint32_t height) {
    std::vector<Bytef> raw;
    for (std::uint32_t y = 0; y < height; y++) {
        raw.push_back(0);
        for (std::uint32_t x = 0; x < width; x++) {
            raw.push_back(static_cast<Bytef>(x * 40));
            raw.push_back(static_cast<Bytef>(y * 40));
            raw.push_back(0x80);
        }
    }
    uLongf size = compressBound(static_cast<uLong>(raw.size()));
    std::vector<Bytef> packed(size);
    if (compress(packed.data(), &size, raw.data(), static_cast<uLong>(raw.size())) != Z_OK) {
        throw std::runtime_error("zlib compress failed");
    }
    std::vector<std::byte> out;
    for (uLongf i = 0; i < size; i++) {
        out.push_back(std::byte(packed[i]));
    }
    return out;
}

// Signature + IHDR + IDAT + IEND
inline std::vector<std::byte> minimal_png(std::uint32_t width = 2, std::uint32_t height = 2) {
    auto out = png_signature_bytes();
    append_raw_chunk(out, "IHDR", ihdr_data(width, height));
    append_raw_chunk(out, "IDAT", idat_data(width, height));
    append_raw_chunk(out, "IEND", {});
    return out;
}

inline const std::string secret_message = "This is where your secret message will be!";
inline constexpr std::uint32_t secret_message_crc = 2882656334u; // CRC-32 of "RuSt" + secret_message
