//
// Created by igor on 15/08/2025.
//

#include <pngstash/png.hh>
#include <pngstash/chunk_iterator.hh>
#include <pngstash/exceptions.hh>
#include <algorithm>
#include <ostream>

namespace pngstash {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::from_chunks(std::vector<chunk> chunks) {
        return png(std::move(chunks));
    }

    png png::decode(const std::byte* data, std::size_t size, const parse_options& options) {
        std::vector<chunk> chunks;
        for (chunk_iterator it(data, size, options); it.has_next(); it.next()) {
            chunks.push_back(it.current().value);
        }
        return png(std::move(chunks));
    }

    png png::decode(const std::vector<std::byte>& bytes, const parse_options& options) {
        return decode(bytes.data(), bytes.size(), options);
    }

    std::vector<std::byte> png::encode() const {
        std::vector<std::byte> out;
        out.reserve(total_size());
        for (std::uint8_t b : standard_signature) {
            out.push_back(std::byte(b));
        }
        for (const auto& c : m_chunks) {
            c.encode_to(out);
        }
        return out;
    }

    void png::append_chunk(chunk c) {
        auto end_it = std::find_if(m_chunks.begin(), m_chunks.end(), [](const chunk& existing) {
            return existing.type() == end_marker;
        });
        m_chunks.insert(end_it, std::move(c));
    }

    chunk png::remove_chunk(const chunk_type& type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& existing) {
            return existing.type() == type;
        });
        if (it == m_chunks.end()) {
            THROW_NOT_FOUND("No chunk of type '", type, "' in PNG file (", m_chunks.size(), " chunks)");
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    chunk png::remove_chunk(std::string_view type) {
        return remove_chunk(chunk_type::from_text(type));
    }

    const chunk* png::chunk_by_type(const chunk_type& type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& existing) {
            return existing.type() == type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        return chunk_by_type(chunk_type::from_text(type));
    }

    std::vector<const chunk*> png::chunks_by_type(const chunk_type& type) const {
        std::vector<const chunk*> result;
        for (const auto& c : m_chunks) {
            if (c.type() == type) {
                result.push_back(&c);
            }
        }
        return result;
    }

    std::size_t png::total_size() const {
        std::size_t total = standard_signature.size();
        for (const auto& c : m_chunks) {
            total += c.total_size();
        }
        return total;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "Png { Signature: [";
        for (std::size_t i = 0; i < png::standard_signature.size(); i++) {
            if (i > 0) {
                os << ", ";
            }
            os << unsigned(png::standard_signature[i]);
        }
        os << "], Chunks: " << p.chunks().size() << "\n";
        for (const auto& c : p.chunks()) {
            os << "  " << c << "\n";
        }
        os << "}";
        return os;
    }

} // namespace pngstash
