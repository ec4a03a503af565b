#pragma once

#include <cstddef>

#include <algorithm>
#include <functional>
#include <thread>
#include <utility>
#include <vector>

#include <boost/utility/string_view.hpp>

#include "aux/findings.hpp"
#include "aux/line_scanner.hpp"
#include "processors/worker_pool.hpp"
#include "splitters/line_splitter.hpp"
#include "strat/sequential.hpp"

namespace walletmask::strat
{

namespace detail
{

///
/// @brief      Cuts a region into blocks of about equal size, each but the last
///             one ends right after a line feed
///
/// @param[in]  region        The region to cut
/// @param[in]  blocks_count  The desired number of blocks, fewer are given for short regions
///
inline std::vector<boost::string_view> split_blocks(boost::string_view region, size_t blocks_count)
{
    std::vector<boost::string_view> blocks;
    if (region.empty() || 0 == blocks_count)
        return blocks;

    auto const block_size = std::max(static_cast<size_t>(1), region.size() / blocks_count);
    for (size_t first = 0; first < region.size();)
    {
        auto last = region.size();
        if (blocks.size() + 1 < blocks_count)
        {
            auto const nl = region.find('\n', std::min(region.size(), first + block_size) - 1);
            if (boost::string_view::npos != nl)
                last = nl + 1;
        }
        blocks.push_back(region.substr(first, last - first));
        first = last;
    }

    return blocks;
}

} // namespace detail

///
/// @brief      Scans each line of a region with the detector, all the findings
///             are given to a sink in line number ascending order
///             Strategy 'Divide-and-Conquer' is used
///
/// @details    The region is cut into line-aligned blocks of about equal size,
///             each is scanned by a task of a worker pool, no synchronization is required
///             Line numbers are restored afterwards from the line counts of the blocks
///
/// @param[in]  region          The region, a memory mapped file for instance
/// @param[in]  detector        A detector called on each line
/// @param[in]  findings_sink   A sink for findings of a line, called with LineFindings&&
/// @param[in]  workers_count   A number of threads to use
///
/// @return     The number of matches found
///
template <typename DetectorT, typename FindingsSink>
size_t divide_and_conquer(boost::string_view region, DetectorT detector, FindingsSink findings_sink, size_t workers_count = std::thread::hardware_concurrency())
{
    workers_count = std::max(static_cast<size_t>(1), workers_count);

    auto const blocks = detail::split_blocks(region, workers_count);

    using Scanner = walletmask::detail::LineScanner<DetectorT>;
    std::vector<Scanner> scanners(blocks.size(), Scanner(detector));

    WorkerPool pool(workers_count);
    pool.run();
    for (size_t i = 0; i < blocks.size(); ++i)
    {
        pool([block = blocks[i], &scanner = scanners[i]] {
            sequential(LineSplitter(block), std::ref(scanner));
        });
    }
    pool.wait();

    size_t line_offset   = 0;
    size_t matches_count = 0;
    for (auto &scanner : scanners)
    {
        for (auto &line_findings : scanner.findings())
        {
            line_findings.first += line_offset;
            matches_count += line_findings.second.size();
            findings_sink(std::move(line_findings));
        }
        line_offset += scanner.lines_count();
    }

    return matches_count;
}

} // namespace walletmask::strat
