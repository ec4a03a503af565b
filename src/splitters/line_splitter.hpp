#pragma once

#include <cstddef>

#include <boost/utility/string_view.hpp>

namespace walletmask
{

///
/// @brief      Strips the carriage return a CRLF line ends with
///
inline boost::string_view chomp(boost::string_view line) noexcept
{
    if (!line.empty() && '\r' == line.back())
        line.remove_suffix(1);
    return line;
}

///
/// @brief      This class describes a splitter that cuts a contiguous character
///             region into lines without copying them
///
/// @details    The region is not owned, it must outlive the lines given out
///             A line feed ending the region does not open an empty line after it
///
class LineSplitter
{
public:
    explicit LineSplitter(boost::string_view region) noexcept
        : region_(region)
    {
    }

    ///
    /// @brief      Gets the next line, an empty view once the splitter is exhausted
    ///
    boost::string_view operator()() noexcept
    {
        exhausted_ = region_.size() == pos_;
        if (exhausted_)
        {
            terminator_ = {};
            return {};
        }

        auto const nl   = region_.find('\n', pos_);
        auto const last = boost::string_view::npos == nl ? region_.size() : nl;
        auto const line = chomp(region_.substr(pos_, last - pos_));
        auto const next = boost::string_view::npos == nl ? last : nl + 1;
        terminator_     = region_.substr(pos_ + line.size(), next - pos_ - line.size());
        pos_            = next;
        return line;
    }

    ///
    /// @brief      Gets the bytes the last line given has been ended with:
    ///             "\r\n", "\n", or nothing for the last line of the region
    ///
    boost::string_view terminator() const noexcept { return terminator_; }

    ///
    /// @brief      Checks if the last call to operator() has given a line
    ///
    operator bool() const noexcept { return !exhausted_; }
    bool operator!() const noexcept { return exhausted_; }

    size_t bytes_left() const noexcept { return region_.size() - pos_; }

    void reset() noexcept
    {
        pos_        = 0;
        exhausted_  = false;
        terminator_ = {};
    }

private:
    boost::string_view region_;
    boost::string_view terminator_;
    size_t             pos_       = 0;
    bool               exhausted_ = false;
};

} // namespace walletmask
