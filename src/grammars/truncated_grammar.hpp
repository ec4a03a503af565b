#pragma once

#include <cstddef>

#include "detect/charset.hpp"
#include "detect/match.hpp"
#include "detect/utf8_text.hpp"

#include "grammars/grammar.hpp"

namespace walletmask::grammars
{

///
/// @brief      One side of an elided identifier: an optional prefix and a bounded run
///
template <typename Prefix, typename Alphabet, size_t kMinRun, size_t kMaxRun>
struct Fragment
{
    ///
    /// @return     The length of the fragment at pos, 0 if there is none
    ///
    static size_t match(Utf8Text const &text, size_t pos) noexcept
    {
        auto const prefix_len = Prefix::match(text, pos);
        if (kMismatch == prefix_len)
            return 0;
        auto const run = run_length<Alphabet>(text, pos + prefix_len, kMaxRun);
        return kMinRun <= run && run <= kMaxRun ? prefix_len + run : 0;
    }
};

///
/// @return     The length of an ellipsis ("..." or U+2026) at pos, 0 if there is none
///
inline size_t ellipsis_length(Utf8Text const &text, size_t pos) noexcept
{
    if (pos < text.size() && U'\u2026' == text[pos])
        return 1;
    return starts_with(text, pos, "...") ? 3 : 0;
}

///
/// Plausibility policies, checked against both fragments of a candidate
///
namespace plausible
{

struct Always
{
    static bool accepts(Utf8Text const &, size_t, size_t, size_t, size_t) noexcept { return true; }
};

///
/// @brief      Needs a hex letter somewhere, "1990...2000" is a range of years
///
struct HexLetters
{
    static bool accepts(Utf8Text const &text, size_t head, size_t head_last, size_t tail, size_t tail_last) noexcept
    {
        return any_of(text, head, head_last, charset::is_hex_letter) || any_of(text, tail, tail_last, charset::is_hex_letter);
    }
};

///
/// @brief      Rejects fragments that both are decimal numbers
///
struct NotDecimal
{
    static bool accepts(Utf8Text const &text, size_t head, size_t head_last, size_t tail, size_t tail_last) noexcept
    {
        return !(all_of(text, head, head_last, charset::is_digit) && all_of(text, tail, tail_last, charset::is_digit));
    }
};

///
/// @brief      Needs a digit, or a lower-case letter together with an upper-case letter
///             that is not the first one of its fragment, "Wait...What" is prose
///
struct Encoded
{
    static bool accepts(Utf8Text const &text, size_t head, size_t head_last, size_t tail, size_t tail_last) noexcept
    {
        if (!NotDecimal::accepts(text, head, head_last, tail, tail_last))
            return false;
        if (any_of(text, head, head_last, charset::is_digit) || any_of(text, tail, tail_last, charset::is_digit))
            return true;
        auto const has_lower = any_of(text, head, head_last, charset::is_lower) || any_of(text, tail, tail_last, charset::is_lower);
        auto const inner_upper = any_of(text, head + 1, head_last, charset::is_upper) || any_of(text, tail + 1, tail_last, charset::is_upper);
        return has_lower && inner_upper;
    }
};

} // namespace plausible

///
/// @brief      Recognizer of elided identifiers like "0x71C7...976F" or "bc1qar…5mdq"
///
/// @tparam     Head        A fragment type for the part before the ellipsis
/// @tparam     Tail        A fragment type for the part after the ellipsis
/// @tparam     Plausible   A plausibility policy for the pair of fragments
///
template <typename Head, typename Tail, typename Plausible = plausible::Always>
class TruncatedGrammar
{
public:
    static constexpr Family family = Family::Truncated;

    size_t match_at(Utf8Text const &text, size_t pos) const noexcept
    {
        if (!at_word_start(text, pos))
            return 0;

        auto const head_len = Head::match(text, pos);
        if (0 == head_len)
            return 0;

        auto const sep_len = ellipsis_length(text, pos + head_len);
        if (0 == sep_len)
            return 0;

        auto const tail     = pos + head_len + sep_len;
        auto const tail_len = Tail::match(text, tail);
        if (0 == tail_len || !at_word_end(text, tail + tail_len))
            return 0;

        if (!Plausible::accepts(text, pos, pos + head_len, tail, tail + tail_len))
            return 0;

        return tail + tail_len - pos;
    }
};

} // namespace walletmask::grammars
