#pragma once

#include <cstddef>

#include <algorithm>

#include "detect/match.hpp"
#include "detect/utf8_text.hpp"

#include "grammars/grammar.hpp"

namespace walletmask::grammars
{

///
/// @brief      Recognizer of identifiers that form one whole word:
///             an anchoring prefix followed by a run of an alphabet
///
/// @details    The run is taken as a whole: a word whose run is longer than
///             kMaxRun characters is rejected, not shortened, so a 64-digit hash
///             never yields a 40-digit address
///
///             Identifiers with a distinct prefix ("0x", "bc1") may also be written
///             one right after the other. Such an identifier ends where the prefix
///             of the next one begins, and it may start inside a word. A candidate
///             starting inside a word is kept by the matcher only when another
///             identifier ends right before it
///
/// @tparam     kFamily     The family tag of the matches
/// @tparam     Prefix      A prefix policy anchoring the identifier
/// @tparam     Alphabet    The alphabet of the run following the prefix
/// @tparam     kMinRun     The minimal length of the run
/// @tparam     kMaxRun     The maximal length of the run
/// @tparam     Shape       A shape policy checking the whole token
///
template <Family kFamily, typename Prefix, typename Alphabet, size_t kMinRun, size_t kMaxRun, typename Shape = shape::Any>
class WordGrammar
{
    static_assert(kMinRun <= kMaxRun, "the run window is empty");

public:
    static constexpr Family family = kFamily;

    ///
    /// @brief      Recognizes the identifier starting exactly at pos
    ///
    /// @param[in]  text  The text to explore
    /// @param[in]  pos   The character to start at
    ///
    /// @return     The length of the identifier in characters, 0 if there is none
    ///
    size_t match_at(Utf8Text const &text, size_t pos) const noexcept
    {
        auto const prefix_len = Prefix::match(text, pos);
        if (kMismatch == prefix_len)
            return 0;

        if (!Prefix::kGlues && !at_word_start(text, pos))
            return 0;

        auto const body = pos + prefix_len;
        auto const run  = run_length<Alphabet>(text, body, kMaxRun);
        auto       last = body + run;
        if (kMaxRun < run || !ends_at(text, last))
        {
            // the run may have swallowed the prefix of a glued identifier
            last = glue_cut(text, body, body + std::min(run, kMaxRun));
            if (kMismatch == last)
                return 0;
        }

        if (last - body < kMinRun)
            return 0;
        if (!Shape::accepts(text, pos, last))
            return 0;

        return last - pos;
    }

private:
    static bool ends_at(Utf8Text const &text, size_t pos) noexcept
    {
        return at_word_end(text, pos) || (Prefix::kGlues && glue_point(text, pos));
    }

    ///
    /// @return     The first glue point in [body + kMinRun, last], kMismatch if there is none
    ///
    static size_t glue_cut(Utf8Text const &text, size_t body, size_t last) noexcept
    {
        if (!Prefix::kGlues)
            return kMismatch;
        for (auto pos = body + kMinRun; pos <= last; ++pos)
        {
            if (glue_point(text, pos))
                return pos;
        }
        return kMismatch;
    }
};

} // namespace walletmask::grammars
