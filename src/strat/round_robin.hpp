#pragma once

#include <cstddef>

#include <algorithm>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/range/algorithm/sort.hpp>

#include "aux/findings.hpp"
#include "aux/line_scanner.hpp"
#include "processors/threaded_line_processor.hpp"
#include "strat/sequential.hpp"

namespace walletmask::strat
{

namespace detail
{

struct IndexedLine
{
    size_t      idx = 0;
    std::string text;
};

} // namespace detail

///
/// @brief      Scans each line the reader gives with the detector, all the findings
///             are given to a sink in line number ascending order
///             Strategy 'Round-Robin' is used
///
/// @details    Lines are dealt to the workers one by one in turn through lock-free
///             queues, the reading thread never waits for the detection to finish
///             Fits readers that can only be read once, like streams
///
/// @param[in]  reader          A functor-like object giving lines until it is exhausted
/// @param[in]  detector        A detector called on each line
/// @param[in]  findings_sink   A sink for findings of a line, called with LineFindings&&
/// @param[in]  workers_count   A number of threads to use
///
/// @return     The number of matches found
///
template <typename LineReader, typename DetectorT, typename FindingsSink>
size_t round_robin(LineReader reader, DetectorT detector, FindingsSink findings_sink, size_t workers_count = std::thread::hardware_concurrency())
{
    workers_count = std::max(static_cast<size_t>(1), workers_count);

    using Scanner = walletmask::detail::LineScanner<DetectorT>;
    std::vector<Scanner> scanners(workers_count, Scanner(detector));

    if (workers_count < 2)
    {
        sequential(reader, std::ref(scanners.front()));
    }
    else
    {
        auto make_handler = [](Scanner &scanner) {
            return [&scanner](detail::IndexedLine &&line) { scanner(line.idx, line.text); };
        };

        using Processor = ThreadedLineProcessor<decltype(make_handler(scanners.front())), detail::IndexedLine>;

        std::vector<std::unique_ptr<Processor>> processors;
        processors.reserve(scanners.size());
        for (auto &scanner : scanners)
            processors.push_back(std::make_unique<Processor>(make_handler(scanner)));

        for (auto &processor : processors)
            processor->start();

        size_t line_idx = 0;
        for (auto line = reader(); reader; ++line_idx, line = reader())
        {
            auto &processor = *processors[line_idx % processors.size()];
            // a processor refuses lines only when its handler has failed, stop() reports why
            if (!processor(detail::IndexedLine{line_idx, std::string(line.begin(), line.end())}))
                break;
        }

        for (auto &processor : processors)
            processor->stop();
    }

    walletmask::detail::LinesFindings lines_findings;
    for (auto &scanner : scanners)
        std::move(scanner.findings().begin(), scanner.findings().end(), std::back_inserter(lines_findings));

    // every worker has got lines in ascending order, only interleaving is left to restore
    boost::sort(lines_findings, [](auto const &lhs, auto const &rhs) { return lhs.first < rhs.first; });

    size_t matches_count = 0;
    for (auto &line_findings : lines_findings)
    {
        matches_count += line_findings.second.size();
        findings_sink(std::move(line_findings));
    }

    return matches_count;
}

} // namespace walletmask::strat
