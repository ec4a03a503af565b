#pragma once

#include <cstddef>

#include <algorithm>

#include "detect/charset.hpp"
#include "detect/utf8_text.hpp"

namespace walletmask::grammars
{

///
/// @brief      Length returned by prefix policies that do not match
///
constexpr size_t kMismatch = static_cast<size_t>(-1);

inline bool at_word_start(Utf8Text const &text, size_t pos) noexcept
{
    return 0 == pos || !charset::is_word(text[pos - 1]);
}

inline bool at_word_end(Utf8Text const &text, size_t pos) noexcept
{
    return text.size() <= pos || !charset::is_word(text[pos]);
}

///
/// @brief      Counts characters of an alphabet starting from pos
///
/// @details    Counting stops at limit + 1, that is enough for a caller to tell
///             a run that is too long from one that fits
///
/// @tparam     Alphabet    A type with static bool contains(char32_t)
///
template <typename Alphabet>
size_t run_length(Utf8Text const &text, size_t pos, size_t limit) noexcept
{
    auto const last = std::min(text.size(), pos + limit + 1);
    size_t     len  = 0;
    while (pos + len < last && Alphabet::contains(text[pos + len]))
        ++len;
    return len;
}

///
/// @brief      Compares ASCII literal with the text at pos ignoring case
///
inline bool starts_with(Utf8Text const &text, size_t pos, char const *literal) noexcept
{
    for (; *literal; ++literal, ++pos)
    {
        if (text.size() <= pos || charset::to_lower(text[pos]) != static_cast<char32_t>(*literal))
            return false;
    }
    return true;
}

template <typename Pred>
bool any_of(Utf8Text const &text, size_t first, size_t last, Pred pred)
{
    return std::any_of(std::next(text.begin(), first), std::next(text.begin(), last), pred);
}

template <typename Pred>
bool all_of(Utf8Text const &text, size_t first, size_t last, Pred pred)
{
    return std::all_of(std::next(text.begin(), first), std::next(text.begin(), last), pred);
}

namespace alphabet
{

struct Hex    { static constexpr bool contains(char32_t c) noexcept { return charset::is_hex(c); } };
struct Base58 { static constexpr bool contains(char32_t c) noexcept { return charset::is_base58(c); } };
struct Bech32 { static constexpr bool contains(char32_t c) noexcept { return charset::is_bech32(c); } };

} // namespace alphabet

///
/// Prefix policies. match() returns the length of the prefix found at pos or kMismatch
/// kGlues tells whether the prefix is distinct enough to separate two identifiers
/// written one right after the other, see glue_point()
///
namespace prefix
{

struct None
{
    static constexpr bool kGlues = false;

    static size_t match(Utf8Text const &, size_t) noexcept { return 0; }
};

///
/// @brief      "0x" of EVM hex identifiers, lower-case x only
///
struct Hex
{
    static constexpr bool kGlues = true;

    static size_t match(Utf8Text const &text, size_t pos) noexcept
    {
        return pos + 1 < text.size() && U'0' == text[pos] && U'x' == text[pos + 1] ? 2 : kMismatch;
    }
};

///
/// @brief      Version character of legacy P2PKH ('1') and P2SH ('3') addresses
///
struct BtcVersion
{
    static constexpr bool kGlues = false;

    static size_t match(Utf8Text const &text, size_t pos) noexcept
    {
        return pos < text.size() && (U'1' == text[pos] || U'3' == text[pos]) ? 1 : kMismatch;
    }
};

///
/// @brief      Mainnet human readable part with its separator, either case
///
struct Segwit
{
    static constexpr bool kGlues = true;

    static size_t match(Utf8Text const &text, size_t pos) noexcept
    {
        return starts_with(text, pos, "bc1") ? 3 : kMismatch;
    }
};

} // namespace prefix

///
/// @brief      Checks if a prefix distinct enough to start a glued identifier is at pos
///
inline bool glue_point(Utf8Text const &text, size_t pos) noexcept
{
    return kMismatch != prefix::Hex::match(text, pos) || kMismatch != prefix::Segwit::match(text, pos);
}

///
/// Shape policies, lightweight checks applied to a whole token [first, last)
///
namespace shape
{

struct Any
{
    static bool accepts(Utf8Text const &, size_t, size_t) noexcept { return true; }
};

///
/// @brief      Rejects tokens that are plain hex or decimal numbers
///
struct NotAllHex
{
    static bool accepts(Utf8Text const &text, size_t first, size_t last) noexcept
    {
        return !all_of(text, first, last, charset::is_hex);
    }
};

///
/// @brief      Base58 payloads of random bytes carry letters of both cases
///
struct Scrambled
{
    static bool accepts(Utf8Text const &text, size_t first, size_t last) noexcept
    {
        return NotAllHex::accepts(text, first, last)
            && any_of(text, first, last, charset::is_upper)
            && any_of(text, first, last, charset::is_lower);
    }
};

///
/// @brief      Bech32 strings must not mix cases
///
struct SingleCase
{
    static bool accepts(Utf8Text const &text, size_t first, size_t last) noexcept
    {
        return !(any_of(text, first, last, charset::is_upper) && any_of(text, first, last, charset::is_lower));
    }
};

} // namespace shape

} // namespace walletmask::grammars
