#include <cstddef>
#include <cstdlib>

#include <iostream>
#include <stdexcept>
#include <utility>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/iostreams/device/mapped_file.hpp>
#include <boost/utility/string_view.hpp>

#include "aux/findings.hpp"
#include "aux/line_scanner.hpp"
#include "detect/detector.hpp"
#include "mask/masker.hpp"
#include "splitters/line_splitter.hpp"
#include "splitters/stream_splitter.hpp"

#include "strat/divide_and_conquer.hpp"
#include "strat/round_robin.hpp"
#include "strat/sequential.hpp"

#include "application.hpp"

using namespace walletmask;

namespace
{

// prints the identifiers of a line as LINE INDEX FAMILY VALUE
void print_line_findings(detail::LineFindings &&line_findings)
{
    for (auto const &match : line_findings.second)
        std::cout << line_findings.first << ' ' << match << '\n';
}

void print_count(Options const &options, size_t matches_count)
{
    if (options.print_count)
        std::cerr << "found " << matches_count << " identifier(s)\n";
}

///
/// @brief      Prints every line the reader gives with its identifiers rendered by the style,
///             each line keeps its own terminator so a revealed output equals the input
///
template <typename LineReader>
int mask_run(LineReader reader, Options const &options)
{
    Detector const detector{};
    size_t         matches_count = 0;

    strat::sequential(reader, [&](size_t, auto const &line) {
        auto const text    = detail::as_string_view(line);
        auto const matches = detector(text);
        matches_count += matches.size();
        std::cout << render(text, matches, options.style) << reader.terminator();
    });

    print_count(options, matches_count);
    return EXIT_SUCCESS;
}

int streamed_run(std::istream &is, Options const &options)
{
    if (OutputMode::Mask == options.mode)
        return mask_run(StreamSplitter(is), options);

    print_count(options, strat::round_robin(StreamSplitter(is), Detector(), print_line_findings, options.jobs));
    return EXIT_SUCCESS;
}

int mapped_run(boost::string_view region, Options const &options)
{
    if (OutputMode::Mask == options.mode)
        return mask_run(LineSplitter(region), options);

    print_count(options, strat::divide_and_conquer(region, Detector(), print_line_findings, options.jobs));
    return EXIT_SUCCESS;
}

int run(Options const &options)
{
    // '-' stands for stdin, anything else is a path
    if ("-" == options.input)
    {
        // nothing reads stdin through stdio, the sync is not needed
        std::cin.sync_with_stdio(false);
        return streamed_run(std::cin, options);
    }

    boost::filesystem::path const input_file_path(options.input);

    if (!boost::filesystem::exists(input_file_path))
    {
        std::cerr << "error: input file " << input_file_path << " does not exist\n";
        return EXIT_FAILURE;
    }

    // directories, sockets, block devices, etc. are not scanned
    if (!boost::filesystem::is_regular_file(input_file_path))
    {
        std::cerr << "error: input file " << input_file_path << " is not regular\n";
        return EXIT_FAILURE;
    }

    // an empty file has nothing to detect, it is not mappable either
    if (boost::filesystem::is_empty(input_file_path))
    {
        std::cerr << "input file " << input_file_path << " is empty\n";
        print_count(options, 0);
        return EXIT_SUCCESS;
    }

    boost::iostreams::mapped_file_source mmap_source_file;
    try
    {
        // the file is mapped in readonly mode
        mmap_source_file.open(input_file_path);
    }
    catch (std::exception const &ex)
    {
        std::cerr << "WARNING: mapping file " << input_file_path << " failed: " << ex.what() << '\n';
    }

    if (!mmap_source_file.is_open())
    {
        std::cerr << "WARNING: falling back to the stream-oriented reading mode\n";

        boost::filesystem::ifstream stream_source_file{input_file_path};
        if (!stream_source_file)
        {
            std::cerr << "error: opening file " << input_file_path << " in stream-mode failed\n";
            return EXIT_FAILURE;
        }

        return streamed_run(stream_source_file, options);
    }

    return mapped_run(boost::string_view(mmap_source_file.data(), mmap_source_file.size()), options);
}

} // anonymous namespace

///
/// @brief      main function, entry point to the program
///
/// @param[in]  argc  The count of arguments
/// @param      argv  The arguments array, see Application::help()
///
/// @return     result of the program, 0 when success, another value otherwise
///
int main(int argc, char const *argv[]) try
{
    // output goes through iostreams only
    std::cout.sync_with_stdio(false);
    std::cerr.sync_with_stdio(false);

    // printing the help page if no arguments given
    if (argc < 2)
    {
        Application::instance().help();
        return EXIT_SUCCESS;
    }

    Options options;
    try
    {
        options = Application::instance().parse(argc, argv);
    }
    catch (std::invalid_argument const &ex)
    {
        std::cerr << "error: " << ex.what() << '\n';
        Application::instance().help();
        return EXIT_FAILURE;
    }

    if (options.help)
    {
        Application::instance().help();
        return EXIT_SUCCESS;
    }

    return run(options);
}
catch (std::exception const &ex)
{
    std::cerr << "error: " << ex.what() << '\n';
    return EXIT_FAILURE;
}
catch (...)
{
    std::cerr << "internal error\n";
    return EXIT_FAILURE;
}
