#pragma once

#include <cstddef>

#include <string>

#include <boost/utility/string_view.hpp>

#include "detect/match.hpp"
#include "detect/utf8_text.hpp"

namespace walletmask
{

///
/// @brief      How detected identifiers are rendered
///
struct MaskStyle
{
    bool enabled = true; // false leaves identifiers visible
    char glyph   = '*';  // replaces every character of an identifier
};

///
/// @brief      A piece of a text, either a gap between identifiers or an identifier
///
struct Segment
{
    boost::string_view text;
    Match const       *match = nullptr;

    bool masked() const noexcept { return nullptr != match; }
};

///
/// @brief      Splits a text into gaps and identifiers covering it as a whole
///
/// @param[in]  text     The text the matches were detected in
/// @param[in]  matches  Matches of the text, ordered and disjoint
/// @param[in]  out      The output iterator for segments
///
/// @tparam     OutputIt
///
/// @return     The output iterator past the last segment stored
///
template <typename OutputIt>
OutputIt splice(boost::string_view text, MatchList const &matches, OutputIt out)
{
    size_t last = 0;
    for (auto const &match : matches)
    {
        if (last < match.offset)
        {
            *out = Segment{text.substr(last, match.offset - last)};
            ++out;
        }
        *out = Segment{text.substr(match.offset, match.value.size()), &match};
        ++out;
        last = match.offset + match.value.size();
    }
    if (last < text.size())
    {
        *out = Segment{text.substr(last)};
        ++out;
    }
    return out;
}

///
/// @brief      Renders the text with its identifiers masked by the style given
///
/// @details    One glyph stands for one character so the rendered text keeps
///             the character layout of the source
///
inline std::string render(boost::string_view text, MatchList const &matches, MaskStyle const &style)
{
    if (!style.enabled || matches.empty())
        return std::string(text.data(), text.size());

    std::string rendered;
    rendered.reserve(text.size());

    size_t last = 0;
    for (auto const &match : matches)
    {
        rendered.append(text.data() + last, match.offset - last);
        rendered.append(Utf8Text(match.value).size(), style.glyph);
        last = match.offset + match.value.size();
    }
    rendered.append(text.data() + last, text.size() - last);

    return rendered;
}

} // namespace walletmask
