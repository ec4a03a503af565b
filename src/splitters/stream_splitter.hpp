#pragma once

#include <istream>
#include <string>

#include <boost/utility/string_view.hpp>

namespace walletmask
{

///
/// @brief      This class describes a splitter reading lines of a stream one by one
///
class StreamSplitter
{
public:
    ///
    /// @brief      Constructs stream splitter
    ///
    /// @param[in]  is     Input stream, it must outlive the splitter
    ///
    explicit StreamSplitter(std::istream &is) noexcept
        : is_(is)
    {
    }

    ///
    /// @brief      Gets the next line with its line feed and carriage return removed
    ///
    std::string operator()()
    {
        std::string line;
        terminator_ = {};
        if (!std::getline(is_, line))
            return line;

        auto const cr = !line.empty() && '\r' == line.back();
        if (cr)
            line.pop_back();

        // getline stops at eof without a line feed only on the last line
        if (is_.eof())
            terminator_ = cr ? "\r" : "";
        else
            terminator_ = cr ? "\r\n" : "\n";
        return line;
    }

    ///
    /// @brief      Gets the bytes the last line given has been ended with
    ///
    boost::string_view terminator() const noexcept { return terminator_; }

    ///
    /// @brief      Checks if the last call to operator() has given a line
    ///
    operator bool() const noexcept { return static_cast<bool>(is_); }
    bool operator!() const noexcept { return !is_; }

private:
    std::istream      &is_;
    boost::string_view terminator_;
};

} // namespace walletmask
