/**
 * @file parser.hh
 * @brief Callback-style iteration over the chunks of a PNG buffer
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <vector>
#include <cstddef>
#include <pngstash/chunk_iterator.hh>
#include <pngstash/parse_options.hh>

namespace pngstash {

    /**
     * @brief Call a function for every chunk in a PNG buffer
     *
     * Chunks are decoded one at a time; no png container is built.
     * Decoding errors propagate after func has seen the chunks before
     * the failing one.
     *
     * @tparam Func Callable type accepting const chunk_iterator::chunk_info&
     * @param data PNG file contents
     * @param size Buffer size
     * @param func Function to call for each chunk
     * @param options Decoding options
     */
    template<typename Func>
    void for_each_chunk(const std::byte* data, std::size_t size, Func func, const parse_options& options) {
        for (chunk_iterator it(data, size, options); it.has_next(); it.next()) {
            func(it.current());
        }
    }

    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func, const parse_options& options) {
        for_each_chunk(bytes.data(), bytes.size(), func, options);
    }

    /**
     * @brief Call a function for every chunk, using default options
     */
    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func) {
        for_each_chunk(bytes.data(), bytes.size(), func, parse_options{});
    }

} // namespace pngstash
