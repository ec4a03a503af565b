#pragma once

#include <cstddef>

#include <string>
#include <utility>

#include <boost/utility/string_view.hpp>

#include "aux/findings.hpp"

namespace walletmask::detail
{

inline boost::string_view as_string_view(boost::string_view line) noexcept { return line; }
inline boost::string_view as_string_view(std::string const &line) noexcept { return line; }

///
/// @brief      Runs a detector over lines and keeps the findings of those having any
///
/// @tparam     DetectorT   A functor-like detector, MatchList(boost::string_view)
///
template <typename DetectorT>
class LineScanner
{
public:
    explicit LineScanner(DetectorT detector)
        : detector_(std::move(detector))
    {
    }

    ///
    /// @brief      Scans a line
    ///
    /// @param[in]  line_idx  0-based index of the line in its region
    /// @param[in]  line      The line
    ///
    template <typename Line>
    void operator()(size_t line_idx, Line const &line)
    {
        auto matches = detector_(as_string_view(line));
        if (!matches.empty())
            findings_.emplace_back(line_idx + 1, std::move(matches));
        lines_count_ = line_idx + 1;
    }

    auto &      findings() noexcept { return findings_; }
    auto const &findings() const noexcept { return findings_; }

    ///
    /// @brief      Gets the number of lines up to the last one scanned
    ///
    size_t lines_count() const noexcept { return lines_count_; }

    ///
    /// @brief      Gets the number of matches found
    ///
    size_t matches_count() const noexcept
    {
        size_t count = 0;
        for (auto const &line_findings : findings_)
            count += line_findings.second.size();
        return count;
    }

private:
    DetectorT     detector_;
    LinesFindings findings_;
    size_t        lines_count_ = 0;
};

} // namespace walletmask::detail
