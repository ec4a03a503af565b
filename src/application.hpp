#pragma once

#include <cstddef>

#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/lexical_cast.hpp>
#include <boost/utility/string_view.hpp>

#include "mask/masker.hpp"

namespace walletmask
{

///
/// @brief      What the application prints for its input
///
enum class OutputMode
{
    List, // findings, one per output line
    Mask, // the input with its identifiers masked
};

///
/// @brief      Options of a run given through the arguments
///
struct Options
{
    std::string input;
    OutputMode  mode        = OutputMode::List;
    MaskStyle   style;
    size_t      jobs        = std::thread::hardware_concurrency();
    bool        print_count = false;
    bool        help        = false;
};

///
/// @brief          Class that is used for singleton of application's main parameters and requisites
///
class Application final
{
public:
    static Application &instance() noexcept
    {
        static Application app;
        return app;
    }

public:
    ///
    /// @brief      Gets the validator for the mask glyph
    ///
    auto glyph_validator() const noexcept
    {
        return [](char c) { return 0x20 < c && c < 0x7F; };
    }

    ///
    /// @brief      Parses the arguments of the program
    ///
    /// @param[in]  argc  The count of arguments
    /// @param      argv  The arguments array, argv[0] is the name of the program
    ///
    /// @return     The options
    ///
    /// @throws     std::invalid_argument if an argument is unknown, misses its value or has a wrong one
    ///
    Options parse(int argc, char const *argv[]) const
    {
        Options options;
        bool    reveal = false;

        for (int i = 1; i < argc; ++i)
        {
            boost::string_view const arg(argv[i]);

            auto value_of = [&]() -> boost::string_view {
                if (argc <= i + 1)
                    throw std::invalid_argument("option '" + arg.to_string() + "' requires a value");
                return argv[++i];
            };

            if ("-h" == arg || "--help" == arg)
            {
                options.help = true;
            }
            else if ("-l" == arg || "--list" == arg)
            {
                options.mode = OutputMode::List;
            }
            else if ("-m" == arg || "--mask" == arg)
            {
                options.mode = OutputMode::Mask;
            }
            else if ("-r" == arg || "--reveal" == arg)
            {
                reveal = true;
            }
            else if ("-c" == arg || "--count" == arg)
            {
                options.print_count = true;
            }
            else if ("-g" == arg || "--glyph" == arg)
            {
                auto const glyph = value_of();
                if (1 != glyph.size() || !glyph_validator()(glyph.front()))
                    throw std::invalid_argument("glyph must be one printable ASCII symbol");
                options.style.glyph = glyph.front();
            }
            else if ("-j" == arg || "--jobs" == arg)
            {
                auto const jobs = value_of();
                try
                {
                    options.jobs = boost::lexical_cast<size_t>(jobs);
                }
                catch (boost::bad_lexical_cast const &)
                {
                    throw std::invalid_argument("jobs must be a positive number, '" + jobs.to_string() + "' given");
                }
                if (0 == options.jobs)
                    throw std::invalid_argument("jobs must be a positive number");
            }
            else if ("-" != arg && !arg.empty() && '-' == arg.front())
            {
                throw std::invalid_argument("unknown option '" + arg.to_string() + "'");
            }
            else if (options.input.empty())
            {
                options.input = arg.to_string();
            }
            else
            {
                std::cerr << "WARNING: redundant parameter '" << arg << "' provided, skipped\n";
            }
        }

        options.style.enabled = !reveal;

        if (!options.help && options.input.empty())
            throw std::invalid_argument("no input given");

        return options;
    }

    ///
    /// @brief      Prints a help page.
    ///
    void help() noexcept
    {
        std::cout << R"help(
usage: walletmask [OPTIONS] INPUT

    INPUT - an input file to process or stdin if '-' is specified

    Every line of the input is scanned for cryptocurrency identifiers:
        EVM addresses and transaction hashes (0x...), ENS names (*.eth),
        Bitcoin legacy and SegWit addresses and transaction ids,
        Solana addresses and transaction signatures,
        and their truncated forms like 0x71C7...976F

options:
    -l, --list      print every identifier found as LINE INDEX FAMILY VALUE (the default)
                    LINE is 1-based, INDEX is the 0-based character position in the line
    -m, --mask      print the input with every identifier masked
    -r, --reveal    with --mask, print the input with identifiers left visible
    -g, --glyph C   the symbol that masks each character of an identifier, '*' by default
    -j, --jobs N    the number of threads to scan with, the number of cores by default
    -c, --count     print the number of identifiers found to stderr
    -h, --help      print this page

examples:
    > walletmask page.txt
        Will list identifiers found in page.txt

    > walletmask --mask --glyph '#' page.txt
        Will print page.txt with identifiers replaced by '#'

    > curl -s https://example.com | walletmask -m -
        Will do the same for stdin, that is tied to stdout of 'curl' by pipelining
    )help"
                     "\n";
    }

private:
    Application() = default;
};

} // namespace walletmask
