#pragma once

#include <cstddef>

#include <vector>

#include <boost/locale/utf.hpp>
#include <boost/utility/string_view.hpp>

namespace walletmask
{

///
/// @brief      A read-only view of UTF-8 text addressed by characters
///
/// @details    Every well-formed code point is one character. Every byte of an
///             ill-formed or incomplete sequence becomes a character of its own
///             holding kInvalid, so any byte string is accepted and characters
///             always map back onto the exact bytes they came from
///
///             The view does not own the bytes, the source must outlive it
///
class Utf8Text
{
public:
    using char_type = char32_t;

    static constexpr char_type kInvalid = 0xFFFD;

    explicit Utf8Text(boost::string_view bytes)
        : bytes_(bytes)
    {
        chars_.reserve(bytes_.size());
        offsets_.reserve(bytes_.size() + 1);

        auto const first = bytes_.begin();
        auto const last  = bytes_.end();
        for (auto it = first; it != last;)
        {
            auto const start = it;
            auto const cp    = boost::locale::utf::utf_traits<char>::decode(it, last);
            offsets_.push_back(static_cast<size_t>(start - first));
            if (boost::locale::utf::illegal == cp || boost::locale::utf::incomplete == cp)
            {
                // resynchronize on the very next byte
                it = start + 1;
                chars_.push_back(kInvalid);
            }
            else
            {
                chars_.push_back(static_cast<char_type>(cp));
            }
        }
        offsets_.push_back(bytes_.size());
    }

    size_t size() const noexcept { return chars_.size(); }
    bool   empty() const noexcept { return chars_.empty(); }

    char_type operator[](size_t idx) const noexcept { return chars_[idx]; }

    ///
    /// @brief      Byte offset of a character, size() maps onto the size of the bytes
    ///
    size_t byte_offset(size_t idx) const noexcept { return offsets_[idx]; }

    ///
    /// @brief      Bytes covered by the characters [first, last)
    ///
    boost::string_view slice(size_t first, size_t last) const noexcept
    {
        return bytes_.substr(offsets_[first], offsets_[last] - offsets_[first]);
    }

    auto begin() const noexcept { return chars_.begin(); }
    auto end() const noexcept { return chars_.end(); }

private:
    boost::string_view     bytes_;
    std::vector<char_type> chars_;
    std::vector<size_t>    offsets_;
};

} // namespace walletmask
