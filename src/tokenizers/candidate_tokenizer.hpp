#pragma once

#include <cstddef>

#include <utility>

#include "detect/match.hpp"
#include "detect/utf8_text.hpp"

#include "grammars/grammar.hpp"

namespace walletmask
{

///
/// @brief      A span of text a grammar has recognized, in characters
///
struct Candidate
{
    size_t first;
    size_t last;
    Family family;
    size_t rank; // precedence of the grammar, the less the stronger
    bool   glued = false; // starts inside a word, another identifier must end at first

    size_t size() const noexcept { return last - first; }
};

///
/// @brief      A tokenizer that uses a grammar given to
///             find all the candidates in a text
///
/// @details    Lookups go from left to right, after a hit the next lookup starts
///             from the end of the candidate found, so candidates of one grammar
///             never overlap each other
///
/// @tparam     Grammar   A grammar type with size_t match_at(Utf8Text const&, size_t)
///                       and a static member family
///
template <typename Grammar>
class CandidateTokenizer
{
public:
    explicit CandidateTokenizer(Grammar grammar = Grammar(), size_t rank = 0) noexcept
        : grammar_(std::move(grammar)), rank_(rank)
    {
    }

    ///
    /// @brief      Tokenizing the text, candidates are pushed to an output iterator
    ///
    /// @param[in]  text    The text to parse
    /// @param[in]  out     The output iterator to store candidates
    ///
    /// @tparam     OutputIt   Output iterator
    ///
    /// @return     The output iterator past the last candidate stored
    ///
    template <typename OutputIt>
    OutputIt operator()(Utf8Text const &text, OutputIt out) const
    {
        for (size_t pos = 0; pos < text.size();)
        {
            auto const len = grammar_.match_at(text, pos);
            if (0 == len)
            {
                ++pos;
                continue;
            }
            *out = Candidate{pos, pos + len, Grammar::family, rank_, !grammars::at_word_start(text, pos)};
            ++out;
            pos += len;
        }
        return out;
    }

private:
    Grammar grammar_;
    size_t  rank_;
};

} // namespace walletmask
