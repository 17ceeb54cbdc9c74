/**
 * @file log_utils.hpp
 * @brief Common utilities for the sinkwright logging facade
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sinkwright
{

/**
 * @brief Text encodings a file sink can write
 *
 * Lines are rendered as UTF-8 and converted when written; characters the
 * target encoding cannot represent are replaced by '?'.
 */
enum class text_encoding : uint8_t
{
    utf8,
    ascii,
    latin1,
};

inline const char *string_from_text_encoding(text_encoding encoding)
{
    switch (encoding)
    {
    case text_encoding::utf8: return "utf-8";
    case text_encoding::ascii: return "ascii";
    case text_encoding::latin1: return "latin-1";
    }
    return "unknown";
}

namespace detail
{

inline std::string to_lower(std::string_view str)
{
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

/**
 * @brief Decode one UTF-8 sequence starting at @p pos
 * @return Code point, or U+FFFD for a malformed sequence; @p pos is advanced past it
 */
inline char32_t next_code_point(std::string_view text, size_t &pos)
{
    auto byte = static_cast<unsigned char>(text[pos++]);
    if (byte < 0x80) return byte;

    size_t extra   = 0;
    char32_t point = 0;
    if ((byte & 0xe0) == 0xc0)
    {
        extra = 1;
        point = byte & 0x1f;
    }
    else if ((byte & 0xf0) == 0xe0)
    {
        extra = 2;
        point = byte & 0x0f;
    }
    else if ((byte & 0xf8) == 0xf0)
    {
        extra = 3;
        point = byte & 0x07;
    }
    else { return 0xfffd; }

    for (size_t i = 0; i < extra; ++i)
    {
        if (pos >= text.size()) return 0xfffd;
        auto cont = static_cast<unsigned char>(text[pos]);
        if ((cont & 0xc0) != 0x80) return 0xfffd;
        point = (point << 6) | (cont & 0x3f);
        ++pos;
    }
    return point;
}

} // namespace detail

/**
 * @brief Parse an encoding name as accepted by the file sink
 *
 * Accepts the common spellings ("utf-8", "UTF8", "ascii", "us-ascii",
 * "latin-1", "latin1", "iso-8859-1").
 */
inline std::optional<text_encoding> text_encoding_from_string(std::string_view name)
{
    std::string lower = detail::to_lower(name);
    lower.erase(std::remove(lower.begin(), lower.end(), '_'), lower.end());

    if (lower == "utf-8" || lower == "utf8") return text_encoding::utf8;
    if (lower == "ascii" || lower == "us-ascii") return text_encoding::ascii;
    if (lower == "latin-1" || lower == "latin1" || lower == "iso-8859-1" || lower == "iso8859-1") return text_encoding::latin1;
    return std::nullopt;
}

/**
 * @brief Append @p utf8 to @p out converted to @p encoding
 */
inline void encode_text(std::string_view utf8, text_encoding encoding, std::string &out)
{
    if (encoding == text_encoding::utf8)
    {
        out.append(utf8);
        return;
    }

    char32_t limit = encoding == text_encoding::ascii ? 0x7f : 0xff;
    size_t pos     = 0;
    while (pos < utf8.size())
    {
        char32_t point = detail::next_code_point(utf8, pos);
        out.push_back(point <= limit ? static_cast<char>(point) : '?');
    }
}

/**
 * @brief Module name of a source file: its file name without directory or extension
 *
 * "src/net/socket.cpp" becomes "socket".
 */
inline std::string_view module_from_path(std::string_view path)
{
    auto slash = path.find_last_of("/\\");
    if (slash != std::string_view::npos) path.remove_prefix(slash + 1);

    auto dot = path.find_last_of('.');
    if (dot != std::string_view::npos && dot > 0) path = path.substr(0, dot);
    return path;
}

} // namespace sinkwright
