#pragma once

namespace walletmask::charset
{

constexpr bool is_digit(char32_t c) noexcept { return U'0' <= c && c <= U'9'; }
constexpr bool is_lower(char32_t c) noexcept { return U'a' <= c && c <= U'z'; }
constexpr bool is_upper(char32_t c) noexcept { return U'A' <= c && c <= U'Z'; }
constexpr bool is_alnum(char32_t c) noexcept { return is_digit(c) || is_lower(c) || is_upper(c); }

constexpr char32_t to_lower(char32_t c) noexcept { return is_upper(c) ? c - U'A' + U'a' : c; }

constexpr bool is_hex(char32_t c) noexcept
{
    return is_digit(c) || (U'a' <= c && c <= U'f') || (U'A' <= c && c <= U'F');
}

constexpr bool is_hex_letter(char32_t c) noexcept { return is_hex(c) && !is_digit(c); }

///
/// @brief      Bitcoin base58 alphabet: alphanumerics without 0, O, I and l
///
constexpr bool is_base58(char32_t c) noexcept
{
    return is_alnum(c) && U'0' != c && U'O' != c && U'I' != c && U'l' != c;
}

///
/// @brief      Bech32 data characters "qpzry9x8gf2tvdw0s3jn54khce6mua7l" in either case
///
constexpr bool is_bech32(char32_t c) noexcept
{
    c = to_lower(c);
    return is_alnum(c) && U'1' != c && U'b' != c && U'i' != c && U'o' != c;
}

constexpr bool is_dns_label(char32_t c) noexcept { return is_alnum(c) || U'-' == c; }

///
/// @brief      Non-ASCII code points that separate words: spaces, punctuation and symbols
///
constexpr bool is_unicode_separator(char32_t c) noexcept
{
    return (0x0080 <= c && c <= 0x00BF && 0x00AA != c && 0x00B5 != c && 0x00BA != c) // latin-1 controls, punctuation
        || 0x00D7 == c || 0x00F7 == c
        || (0x2000 <= c && c <= 0x2BFF) // general punctuation, arrows, math, technical, box drawing, dingbats
        || (0x3000 <= c && c <= 0x303F) // CJK punctuation
        || (0xFE30 <= c && c <= 0xFE4F)
        || (0xFF00 <= c && c <= 0xFF0F) || (0xFF1A <= c && c <= 0xFF20)
        || (0xFF3B <= c && c <= 0xFF40) || (0xFF5B <= c && c <= 0xFF65)
        || 0xFFFD == c || 0xFEFF == c
        || (0x1F000 <= c && c <= 0x1FAFF); // emoji and pictographs
}

///
/// @brief      Characters that make up words for boundary checks
///
constexpr bool is_word(char32_t c) noexcept
{
    if (c < 0x80)
        return is_alnum(c) || U'_' == c;
    return !is_unicode_separator(c);
}

} // namespace walletmask::charset
