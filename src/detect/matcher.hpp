#pragma once

#include <cstddef>

#include <iterator>
#include <tuple>
#include <utility>
#include <vector>

#include <boost/range/algorithm/sort.hpp>

#include "detect/utf8_text.hpp"
#include "tokenizers/candidate_tokenizer.hpp"

namespace walletmask
{

///
/// @brief      Orders candidates by start, a longer one goes first on the same start
///             then the one of the stronger grammar
///
inline bool precedes(Candidate const &lhs, Candidate const &rhs) noexcept
{
    if (lhs.first != rhs.first)
        return lhs.first < rhs.first;
    if (lhs.size() != rhs.size())
        return lhs.size() > rhs.size();
    return lhs.rank < rhs.rank;
}

///
/// @brief      Keeps candidates that do not overlap any candidate accepted before,
///             in the order given by precedes()
///
/// @details    A glued candidate is kept only right after an accepted one
///
/// @param[in]  candidates  Candidates of all grammars in any order
///
/// @return     Disjoint candidates sorted by start
///
inline std::vector<Candidate> resolve_overlaps(std::vector<Candidate> candidates)
{
    boost::sort(candidates, precedes);

    std::vector<Candidate> accepted;
    accepted.reserve(candidates.size());
    for (auto const &candidate : candidates)
    {
        // accepted spans are sorted and disjoint, the last one ends the farthest
        if (!accepted.empty() && candidate.first < accepted.back().last)
            continue;
        if (candidate.glued && (accepted.empty() || accepted.back().last != candidate.first))
            continue;
        accepted.push_back(candidate);
    }
    return accepted;
}

///
/// @brief      Runs every grammar over a text and resolves their candidates
///             into one sequence of disjoint spans
///
/// @tparam     Grammars    Grammar types, the order defines their precedence
///
template <typename... Grammars>
class Matcher
{
public:
    Matcher()
        : tokenizers_(make_tokenizers(std::index_sequence_for<Grammars...>{}))
    {
    }

    ///
    /// @brief      Collects the candidates of all the grammars, overlapping ones included
    ///
    std::vector<Candidate> candidates(Utf8Text const &text) const
    {
        std::vector<Candidate> result;
        std::apply([&](auto const &...tokenizer) { (tokenizer(text, std::back_inserter(result)), ...); }, tokenizers_);
        return result;
    }

    std::vector<Candidate> operator()(Utf8Text const &text) const { return resolve_overlaps(candidates(text)); }

private:
    template <size_t... Ranks>
    static auto make_tokenizers(std::index_sequence<Ranks...>)
    {
        return std::make_tuple(CandidateTokenizer<Grammars>(Grammars(), Ranks)...);
    }

    std::tuple<CandidateTokenizer<Grammars>...> tokenizers_;
};

} // namespace walletmask
