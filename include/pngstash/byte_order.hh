/**
 * @file byte_order.hh
 * @brief Byte order helpers for reading and writing PNG integers
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <pngstash/endian.hh>

namespace pngstash {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) of a multi-byte value
     */
    enum class byte_order {
        little, ///< Little-endian
        big     ///< Big-endian (network order, used by every PNG field)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if no swapping is needed to use a value stored in this order
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    /**
     * @brief Encode a 32-bit unsigned integer as 4 big-endian bytes
     * @param dst Pointer to at least 4 writable bytes
     */
    inline void store_u32_be(std::uint32_t value, std::byte* dst) {
        value = swap32be(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
