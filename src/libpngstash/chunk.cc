//
// Created by igor on 14/08/2025.
//

#include <pngstash/chunk.hh>
#include <pngstash/exceptions.hh>
#include <ostream>
#include <iomanip>
#include <cstring>
#include "input.hh"
#include "checksum.hh"

namespace pngstash {

    namespace {
        // Returns the offset of the first byte that breaks UTF-8, or size if none does
        std::size_t find_invalid_utf8(const std::byte* data, std::size_t size) {
            std::size_t i = 0;
            while (i < size) {
                auto c = static_cast<std::uint8_t>(data[i]);
                std::size_t extra;
                std::uint32_t cp;
                if (c < 0x80) {
                    i++;
                    continue;
                } else if ((c & 0xE0) == 0xC0) {
                    extra = 1;
                    cp = c & 0x1F;
                } else if ((c & 0xF0) == 0xE0) {
                    extra = 2;
                    cp = c & 0x0F;
                } else if ((c & 0xF8) == 0xF0) {
                    extra = 3;
                    cp = c & 0x07;
                } else {
                    return i;
                }

                if (extra > size - i - 1) {
                    return i;
                }
                for (std::size_t k = 1; k <= extra; k++) {
                    auto cc = static_cast<std::uint8_t>(data[i + k]);
                    if ((cc & 0xC0) != 0x80) {
                        return i;
                    }
                    cp = (cp << 6) | (cc & 0x3F);
                }

                // overlong forms, surrogates and values past U+10FFFF
                static constexpr std::uint32_t min_cp[] = {0, 0x80, 0x800, 0x10000};
                if (cp < min_cp[extra] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                    return i;
                }
                i += extra + 1;
            }
            return size;
        }
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(0) {
        THROW_LENGTH_MISMATCH_IF(std::uint64_t(m_data.size()) > max_length,
                                 "Chunk '", m_type, "' payload of ", m_data.size(),
                                 " bytes does not fit the 32-bit length field");
        m_crc = chunk_crc(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::from_text(std::string_view type, std::string_view message) {
        auto parsed = chunk_type::from_text(type);
        const auto* first = reinterpret_cast<const std::byte*>(message.data());
        return {parsed, std::vector<std::byte>(first, first + message.size())};
    }

    chunk chunk::decode(const std::byte* data, std::size_t size,
                        const parse_options& options, std::uint64_t offset) {
        THROW_TRUNCATED_IF(size < overhead, "Chunk at offset ", offset, " is truncated: ", size,
                           " bytes available, a chunk needs at least ", overhead);

        reader in(data, size);
        auto length = in.read<std::uint32_t>(byte_order::big);
        chunk_type type = in.read_chunk_type();

        THROW_LENGTH_MISMATCH_IF(length > options.max_chunk_size,
                                 "Chunk '", type, "' at offset ", offset, " declares length ", length,
                                 " which exceeds the maximum of ", options.max_chunk_size);
        THROW_LENGTH_MISMATCH_IF(std::uint64_t(length) + overhead != size,
                                 "Chunk '", type, "' at offset ", offset, " declares length ", length,
                                 " but occupies ", size, " bytes (expected ",
                                 std::uint64_t(length) + overhead, ")");

        auto payload = in.read_exact(length);
        auto stored = in.read<std::uint32_t>(byte_order::big);
        auto computed = chunk_crc(type, payload.data(), payload.size());
        if (stored != computed) {
            throw checksum_mismatch_error(
                build_error_msg("Checksum mismatch in chunk '", type, "' at offset ", offset,
                                ": stored 0x", std::hex, std::setw(8), std::setfill('0'), stored,
                                ", computed 0x", std::setw(8), std::setfill('0'), computed),
                stored, computed);
        }

        if (!type.is_valid()) {
            if (options.validate_chunk_types) {
                THROW_FORMAT("Chunk at offset ", offset, " has invalid type '", type, "'");
            }
            if (options.on_warning) {
                options.on_warning(offset, "chunk_type",
                                   build_error_msg("Chunk type '", type, "' is not valid, keeping chunk"));
            }
        }

        return {type, std::move(payload), stored};
    }

    chunk chunk::decode(const std::vector<std::byte>& bytes, const parse_options& options) {
        return decode(bytes.data(), bytes.size(), options, 0);
    }

    std::vector<std::byte> chunk::encode() const {
        std::vector<std::byte> out;
        out.reserve(total_size());
        encode_to(out);
        return out;
    }

    void chunk::encode_to(std::vector<std::byte>& out) const {
        std::size_t pos = out.size();
        out.resize(pos + total_size());
        std::byte* dst = out.data() + pos;

        store_u32_be(length(), dst);
        m_type.to_bytes(dst + 4);
        if (!m_data.empty()) {
            std::memcpy(dst + 8, m_data.data(), m_data.size());
        }
        store_u32_be(m_crc, dst + 8 + m_data.size());
    }

    std::string chunk::data_as_text() const {
        std::size_t bad = find_invalid_utf8(m_data.data(), m_data.size());
        THROW_FORMAT_UNLESS(bad == m_data.size(), "Data of chunk '", m_type,
                            "' is not valid UTF-8 text (invalid byte at position ", bad, ")");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    bool chunk::operator==(const chunk& o) const {
        return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        const auto& type = c.type();
        os << "Chunk { Length: " << c.length()
           << ", Type: " << type
           << " [" << unsigned(type[0]) << ", " << unsigned(type[1]) << ", "
           << unsigned(type[2]) << ", " << unsigned(type[3]) << "]"
           << ", Data: [";
        const auto& data = c.data();
        for (std::size_t i = 0; i < data.size(); i++) {
            if (i > 0) {
                os << ", ";
            }
            os << std::to_integer<unsigned>(data[i]);
        }
        os << "], Crc: " << c.crc() << " }";
        return os;
    }

} // namespace pngstash
