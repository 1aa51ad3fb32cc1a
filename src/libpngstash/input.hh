//
// Created by igor on 12/08/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngstash/exceptions.hh>
#include <pngstash/byte_order.hh>
#include <pngstash/chunk_type.hh>

namespace pngstash {

    // Bounds-checked cursor over an in-memory buffer. Throws
    // truncated_input_error instead of reading past the end.
    class reader {
        public:
            reader(const std::byte* data, std::size_t size);

            // Copies up to size bytes, returns how many were copied
            std::size_t read(void* dst, std::size_t size);

            void seek(std::size_t offset);
            void skip(std::size_t size);

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

            // Pointer to the byte at the current position
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

            std::vector<std::byte> read_exact(std::size_t size) {
                THROW_TRUNCATED_IF(size > remaining(), "Unexpected end of buffer at offset ", m_position,
                                   ": requested ", size, " bytes, ", remaining(), " available");
                std::vector<std::byte> buffer(size);
                read(buffer.data(), size);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                THROW_TRUNCATED_IF(sizeof(T) > remaining(), "Failed to read ", sizeof(T),
                                   " bytes at offset ", m_position);
                read(buff.data(), sizeof(T));

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            // Peek at a value without moving the cursor
            template<typename T>
            T peek(byte_order bo) {
                std::size_t pos = m_position;
                T value = read<T>(bo);
                m_position = pos;
                return value;
            }

            chunk_type read_chunk_type();

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
