#pragma once

#include <cstddef>

#include "detect/charset.hpp"
#include "detect/match.hpp"
#include "detect/utf8_text.hpp"

#include "grammars/grammar.hpp"

namespace walletmask::grammars
{

///
/// @brief      Recognizer of ENS names: DNS labels joined by dots ending with ".eth"
///
/// @details    Labels are 1 to 63 characters of [a-z0-9-] in either case and
///             neither start nor end with a hyphen. The longest name ending
///             with an "eth" label is taken, so "pay.vitalik.eth" is one name.
///             A name is at most 253 characters long, that also bounds the walk
///             over a long chain of dotted words
///
class EnsGrammar
{
public:
    static constexpr Family family = Family::EnsName;

    size_t match_at(Utf8Text const &text, size_t pos) const noexcept
    {
        if (!at_word_start(text, pos))
            return 0;

        size_t longest = 0;
        for (size_t label = pos, labels_count = 0; label - pos <= kMaxName; ++labels_count)
        {
            if (labels_count > 0 && label + 3 - pos <= kMaxName && starts_with(text, label, "eth")
                && at_word_end(text, label + 3))
                longest = label + 3 - pos;

            auto const len = label_length(text, label);
            if (0 == len)
                break;

            label += len;
            if (text.size() <= label || U'.' != text[label])
                break;
            ++label;
        }

        return longest;
    }

private:
    struct DnsLabel { static constexpr bool contains(char32_t c) noexcept { return charset::is_dns_label(c); } };

    static constexpr size_t kMaxLabel = 63;
    static constexpr size_t kMaxName  = 253;

    static size_t label_length(Utf8Text const &text, size_t pos) noexcept
    {
        auto const len = run_length<DnsLabel>(text, pos, kMaxLabel);
        if (0 == len || kMaxLabel < len)
            return 0;
        if (!charset::is_alnum(text[pos]) || !charset::is_alnum(text[pos + len - 1]))
            return 0;
        return len;
    }
};

} // namespace walletmask::grammars
