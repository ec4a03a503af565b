#include <cstddef>

#include <algorithm>
#include <functional>
#include <random>
#include <sstream>
#include <string>

#include <benchmark/benchmark.h>

#include <boost/utility/string_view.hpp>

#include "detect/detector.hpp"
#include "detect/utf8_text.hpp"
#include "splitters/line_splitter.hpp"
#include "splitters/stream_splitter.hpp"

#include "strat/divide_and_conquer.hpp"
#include "strat/round_robin.hpp"

using namespace benchmark;

namespace walletmask::bench
{

namespace
{
    // a line of prose with an identifier of every family
    std::string const kLine =
        "Lorem ipsum 0xAb5801a7D398351b8bE11C439e05C5B3259aeC9B dolor vitalik.eth sit "
        "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa amet bc1qar0srrr7xfkvy5l643lydnw9re59gtzzwf5mdq, "
        "consectetur 7xKXtg2CW87d97TXJSDpbD5jBkheTqA83TZRuJosgAsU adipiscing 0x71C7...976F elit";

    auto bm_generate_page(size_t lines_number)
    {
        std::string text;
        text.reserve((kLine.size() + 1) * lines_number);
        for (size_t i = 0; i < lines_number; ++i)
            (text += kLine) += '\n';
        return text;
    }

    // text of symbols identifiers are made of, it makes grammars work hard
    auto bm_generate_noise(size_t symbols_count)
    {
        std::string const symbols = "0123456789abcdefABCDEFxyzXYZ.. \n";

        std::random_device rdev;
        std::default_random_engine gen{rdev()};
        std::uniform_int_distribution<size_t> dist(0, symbols.size() - 1);

        std::string text(symbols_count, '\0');
        std::generate(text.begin(), text.end(), [&] { return symbols[dist(gen)]; });

        return text;
    }

    // a chain of one-letter labels, every label starts a possible ENS name
    auto bm_generate_dotted(size_t labels_count)
    {
        std::string text;
        text.reserve(2 * labels_count);
        for (size_t i = 0; i < labels_count; ++i)
            text += "a.";
        return text;
    }

    auto bm_sink() { return [](auto &&line_findings) { DoNotOptimize(line_findings); }; }
} // anonymous namespace

void BM_Utf8Text_Decode(State &state)
{
    std::string const text = bm_generate_page(state.range(0));

    for (auto _ : state)
    {
        Utf8Text chars(text);
        DoNotOptimize(chars);
    }

    state.SetBytesProcessed(state.iterations() * text.size());
    state.SetComplexityN(state.range(0));
}

template <typename TextGenerator>
void BM_FindMatches(State &state, TextGenerator generator)
{
    std::string const text = generator(state.range(0));

    for (auto _ : state)
    {
        auto matches = find_matches(text);
        DoNotOptimize(matches);
    }

    state.SetBytesProcessed(state.iterations() * text.size());
    state.SetComplexityN(state.range(0));
}

void BM_LineSplitter_Lines(State &state)
{
    auto const lines_number = state.range(0);
    std::string const text  = bm_generate_page(lines_number);

    for (auto _ : state)
    {
        LineSplitter line_splitter(text);
        for (auto line = line_splitter(); line_splitter; line = line_splitter())
            DoNotOptimize(line);
    }

    state.SetItemsProcessed(state.iterations() * lines_number);
    state.SetBytesProcessed(state.iterations() * text.size());
    state.SetComplexityN(lines_number);
}

void BM_StreamSplitter_Lines(State &state)
{
    auto const lines_number = state.range(0);
    std::string const text  = bm_generate_page(lines_number);

    for (auto _ : state)
    {
        state.PauseTiming();
        std::istringstream text_stream(text);
        StreamSplitter line_splitter(text_stream);
        state.ResumeTiming();
        for (auto line = line_splitter(); line_splitter; line = line_splitter())
            DoNotOptimize(line);
    }

    state.SetItemsProcessed(state.iterations() * lines_number);
    state.SetBytesProcessed(state.iterations() * text.size());
    state.SetComplexityN(lines_number);
}

void BM_DivideAndConquer(State &state)
{
    auto const lines_number = state.range(0);
    std::string const text  = bm_generate_page(lines_number);

    for (auto _ : state)
    {
        auto matches_count = strat::divide_and_conquer(text, Detector(), bm_sink(), state.range(1));
        DoNotOptimize(matches_count);
    }

    state.SetItemsProcessed(state.iterations() * lines_number);
    state.SetBytesProcessed(state.iterations() * text.size());
}

void BM_RoundRobin(State &state)
{
    auto const lines_number = state.range(0);
    std::string const text  = bm_generate_page(lines_number);

    for (auto _ : state)
    {
        state.PauseTiming();
        std::istringstream text_stream(text);
        state.ResumeTiming();
        auto matches_count = strat::round_robin(StreamSplitter(text_stream), Detector(), bm_sink(), state.range(1));
        DoNotOptimize(matches_count);
    }

    state.SetItemsProcessed(state.iterations() * lines_number);
    state.SetBytesProcessed(state.iterations() * text.size());
}

BENCHMARK(BM_Utf8Text_Decode)
    ->RangeMultiplier(10)
    ->Range(10, 100000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

BENCHMARK_CAPTURE(BM_FindMatches, Page, bm_generate_page)
    ->RangeMultiplier(10)
    ->Range(10, 100000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

BENCHMARK_CAPTURE(BM_FindMatches, Noise, bm_generate_noise)
    ->RangeMultiplier(10)
    ->Range(1000, 10000000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

BENCHMARK_CAPTURE(BM_FindMatches, Dotted, bm_generate_dotted)
    ->RangeMultiplier(10)
    ->Range(1000, 1000000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

BENCHMARK(BM_LineSplitter_Lines)
    ->RangeMultiplier(10)
    ->Range(1000, 1000000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

BENCHMARK(BM_StreamSplitter_Lines)
    ->RangeMultiplier(10)
    ->Range(1000, 1000000)
    ->Unit(kMillisecond)
    ->Complexity(oN);

BENCHMARK(BM_DivideAndConquer)
    ->ArgsProduct({{1000, 100000}, {1, 2, 4, 8}})
    ->Unit(kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_RoundRobin)
    ->ArgsProduct({{1000, 100000}, {1, 2, 4, 8}})
    ->Unit(kMillisecond)
    ->UseRealTime();

} // namespace walletmask::bench

BENCHMARK_MAIN();
