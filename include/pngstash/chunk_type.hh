//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>

#include <pngstash/exceptions.hh>

namespace pngstash {
    /**
     * @struct chunk_type
     * @brief 4 byte PNG chunk identifier
     *
     * The case of each letter carries one property bit (bit 5 of the byte):
     * byte 0 ancillary, byte 1 private, byte 2 reserved, byte 3 safe-to-copy.
     * Construction from raw bytes never fails; is_valid() tells whether
     * the bytes form a well-formed type.
     */
    struct chunk_type {
        static constexpr std::uint8_t property_bit = 1u << 5;

        std::array<std::uint8_t, 4> b{0, 0, 0, 0};

        constexpr chunk_type() = default;

        // Constructor from 4 individual bytes, no validation
        constexpr chunk_type(std::uint8_t c0, std::uint8_t c1, std::uint8_t c2, std::uint8_t c3)
            : b{ c0, c1, c2, c3 } {}

        constexpr chunk_type(std::byte c0, std::byte c1, std::byte c2, std::byte c3)
            : b{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                 static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        constexpr explicit chunk_type(const std::array<std::uint8_t, 4>& bytes)
            : b(bytes) {}

        // Constructor from raw bytes (no validation)
        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        // Parse the textual form: exactly 4 ASCII letters
        static chunk_type from_text(std::string_view text) {
            THROW_FORMAT_UNLESS(text.size() == 4,
                                "Chunk type '", text, "' must be exactly 4 characters, got ", text.size());
            chunk_type result;
            for (std::size_t i = 0; i < 4; i++) {
                auto c = static_cast<std::uint8_t>(text[i]);
                THROW_FORMAT_UNLESS(is_letter(c),
                                    "Chunk type '", text, "' has a non-letter character at position ", i);
                result.b[i] = c;
            }
            return result;
        }

        static constexpr bool is_letter(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        [[nodiscard]] constexpr const std::array<std::uint8_t, 4>& bytes() const { return b; }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        // Convert to text; throws format_error unless every byte is a letter
        [[nodiscard]] std::string to_string() const {
            THROW_FORMAT_UNLESS(are_bytes_letters(),
                                "Chunk type bytes [", unsigned(b[0]), ", ", unsigned(b[1]), ", ",
                                unsigned(b[2]), ", ", unsigned(b[3]), "] are not ASCII letters");
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        // Big-endian value, as the 4 bytes appear in the file
        [[nodiscard]] constexpr std::uint32_t to_uint32() const {
            return (std::uint32_t(b[0]) << 24) | (std::uint32_t(b[1]) << 16) |
                   (std::uint32_t(b[2]) << 8) | std::uint32_t(b[3]);
        }

        [[nodiscard]] constexpr bool are_bytes_letters() const {
            return is_letter(b[0]) && is_letter(b[1]) && is_letter(b[2]) && is_letter(b[3]);
        }

        // Property bits
        [[nodiscard]] constexpr bool is_critical() const { return (b[0] & property_bit) == 0; }
        [[nodiscard]] constexpr bool is_ancillary() const { return !is_critical(); }
        [[nodiscard]] constexpr bool is_public() const { return (b[1] & property_bit) == 0; }
        [[nodiscard]] constexpr bool is_private() const { return !is_public(); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return (b[2] & property_bit) == 0; }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return (b[3] & property_bit) != 0; }

        [[nodiscard]] constexpr bool is_valid() const {
            return are_bytes_letters() && is_reserved_bit_valid();
        }

        // Access individual bytes
        constexpr std::uint8_t operator[](std::size_t i) const { return b[i]; }

        // Iterators
        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }
        bool operator<=(const chunk_type& o) const { return b <= o.b; }
        bool operator>(const chunk_type& o) const { return b > o.b; }
        bool operator>=(const chunk_type& o) const { return b >= o.b; }

        // Stream output: letters as-is, anything else escaped
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            auto flags = os.flags();
            auto fill = os.fill();
            for (std::uint8_t c : t.b) {
                if (is_letter(c)) {
                    os << static_cast<char>(c);
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c);
                }
            }
            os.flags(flags);
            os.fill(fill);
            return os;
        }
    };

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal: "ruSt"_ct
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw format_error("Chunk type literal must be exactly 4 characters");
        }
        return {
            static_cast<std::uint8_t>(str[0]),
            static_cast<std::uint8_t>(str[1]),
            static_cast<std::uint8_t>(str[2]),
            static_cast<std::uint8_t>(str[3])
        };
    }

    // Well-known types
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngstash::chunk_type> {
        std::size_t operator()(const pngstash::chunk_type& t) const noexcept {
            return pngstash::chunk_type_hash{}(t);
        }
    };
}
