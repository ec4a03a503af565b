#pragma once

#include <new>
#include <string>

#include <boost/utility/string_view.hpp>

#include "detect/match.hpp"
#include "detect/matcher.hpp"
#include "detect/utf8_text.hpp"
#include "grammars/grammars.hpp"

namespace walletmask
{

///
/// @brief      All the grammars in their precedence order, full forms go first
///
using DefaultMatcher = Matcher<
    grammars::EvmTxHash,
    grammars::EvmAddress,
    grammars::BtcTxId,
    grammars::BtcLegacy,
    grammars::BtcSegwit,
    grammars::SolTxSignature,
    grammars::SolAddress,
    grammars::EnsName,
    grammars::EvmTruncated,
    grammars::BtcTxTruncated,
    grammars::BtcLegacyTruncated,
    grammars::BtcSegwitTruncated,
    grammars::SolTruncated>;

///
/// @brief      Detects identifiers in a text fragment
///
/// @details    Stateless, one instance may be shared between threads
///
/// @tparam     MatcherT    The matcher producing disjoint candidates
///
template <typename MatcherT = DefaultMatcher>
class BasicDetector
{
public:
    ///
    /// @brief      Finds the identifiers of the text
    ///
    /// @param[in]  text    UTF-8 text of one fragment
    ///
    /// @return     Matches ordered by index, disjoint
    ///
    /// @throws     std::bad_alloc
    ///
    MatchList operator()(boost::string_view text) const
    {
        Utf8Text const chars(text);

        auto const spans = matcher_(chars);

        MatchList matches;
        matches.reserve(spans.size());
        for (auto const &span : spans)
        {
            auto const value = chars.slice(span.first, span.last);
            matches.push_back(Match{span.first, std::string(value.data(), value.size()), span.family, chars.byte_offset(span.first)});
        }
        return matches;
    }

private:
    MatcherT matcher_;
};

using Detector = BasicDetector<>;

///
/// @brief      Finds the identifiers of a text fragment
///
/// @details    Never throws, if memory runs out the result is empty
///
inline MatchList find_matches(boost::string_view text) noexcept
{
    try
    {
        return Detector()(text);
    }
    catch (std::bad_alloc const &)
    {
        return {};
    }
}

inline MatchList find_matches(std::string const &text) noexcept { return find_matches(boost::string_view(text)); }

///
/// @brief      Finds the identifiers of a null-terminated text, a null pointer has none
///
inline MatchList find_matches(char const *text) noexcept
{
    return text ? find_matches(boost::string_view(text)) : MatchList();
}

} // namespace walletmask
