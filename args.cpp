#include "args.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <cstdlib>

#ifdef HAS_UNISTD
#include <unistd.h>
#endif
#ifdef HAS_IOCTL
#include <sys/ioctl.h>
#ifndef STDOUT_FILENO
#define STDOUT_FILENO 1
#endif
#endif
#ifdef HAS_WINDOWS
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#endif

#include <cxxopts.hpp>

#include "asciiart.hpp"

static const std::vector<std::string> input_formats =
{
    "BMP",
    #ifdef GIF_FOUND
    "GIF",
    #endif
    #ifdef JPEG_FOUND
    "JPEG",
    #endif
    #ifdef PNG_FOUND
    "PNG",
    #endif
    "PBM", "PGM", "PPM",
};

// width of the terminal attached to stdout, if there is one
static std::optional<int> terminal_cols()
{
    if(auto columns_env = std::getenv("COLUMNS"); columns_env != nullptr)
    {
        try
        {
            if(auto cols = std::stoi(std::string{columns_env}); cols > 0)
                return cols;
        }
        catch(const std::logic_error &)
        {
            // not a number, so ignore it and ask the terminal
        }
    }
    #ifdef HAS_IOCTL
    if(winsize ws; ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) >= 0 && ws.ws_col > 0)
        return static_cast<int>(ws.ws_col);
    #endif
    #ifdef HAS_WINDOWS
    if(CONSOLE_SCREEN_BUFFER_INFO csbi; GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return static_cast<int>(csbi.srWindow.Right - csbi.srWindow.Left + 1);
    #endif
    return {};
}

[[nodiscard]] std::optional<Args> parse_args(int argc, char * argv[])
{
    auto prog_name = std::string{argv[0]};
    if(auto sep_pos = prog_name.find_last_of("\\/"); sep_pos != std::string::npos)
        prog_name = prog_name.substr(sep_pos + 1);

    cxxopts::Options options{prog_name, "Convert an image to ASCII art"};

    std::string input_format_list;
    for(std::size_t i = 0; i < std::size(input_formats); ++i)
    {
        if(i > 0)
            input_format_list += ", ";
        input_format_list += input_formats[i];
    }

    try
    {
        options.add_options()
            ("h,help",    "Show this message and quit")
            ("c,cols",    "# of output cols. Defaults to the terminal width if that is smaller", cxxopts::value<int>()->default_value(std::to_string(default_cols)), "COLS")
            ("p,palette", "Chars to draw with, ordered from darkest to brightest pixel",        cxxopts::value<std::string>()->default_value(std::string{default_palette}), "CHARS")
            ("b,bg",      "Background color value for transparent images (0-255)",             cxxopts::value<int>()->default_value("0"), "BG")
            ("i,invert",  "Invert colors")
            ("o,output",  "Output text file path. Output to stdout if '-'",                    cxxopts::value<std::string>()->default_value("-"), "OUTPUT_FILE")
            ("input",     "Input image path",                                                  cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"input"});
        options.positional_help("INPUT");
    }
    catch(const std::exception & e)
    {
        std::cerr<<"Error building argument parser: "<<e.what()<<'\n';
        return {};
    }

    auto help = [&options, &input_format_list](const std::string & msg = "") -> std::string
    {
        auto txt = options.help();

        txt += "\n"
                " Positional arguments:\n"
                "    INPUT  Input image path. Supported formats: " + input_format_list + "\n";

        if(!std::empty(msg))
            txt += '\n' + msg + '\n';

        return txt;
    };

    try
    {
        auto args = options.parse(argc, argv);

        if(args.count("help"))
        {
            std::cerr<<help()<<'\n';
            return {};
        }

        if(!args.count("input"))
        {
            std::cerr<<help("An input image is required")<<'\n';
            return {};
        }

        auto inputs = args["input"].as<std::vector<std::string>>();
        if(std::size(inputs) != 1)
        {
            std::cerr<<help("Exactly one input image may be specified")<<'\n';
            return {};
        }

        std::error_code ec;
        if(!std::filesystem::exists(inputs.front(), ec))
        {
            std::cerr<<help("Input image not found: " + inputs.front())<<'\n';
            return {};
        }

        auto output_filename = args["output"].as<std::string>();

        // only narrow the default to fit a terminal we're actually writing to
        auto cols = args["cols"].as<int>();
        if(!args.count("cols") && output_filename == "-")
        {
            if(auto term_cols = terminal_cols(); term_cols && *term_cols > 0)
                cols = std::min(cols, *term_cols);
        }
        if(cols <= 0)
        {
            std::cerr<<help("Value for --cols must be positive")<<'\n';
            return {};
        }

        auto palette = args["palette"].as<std::string>();
        if(std::empty(palette))
        {
            std::cerr<<help("Value for --palette must not be empty")<<'\n';
            return {};
        }

        if(args["bg"].as<int>() < 0 || args["bg"].as<int>() > 255)
        {
            std::cerr<<help("Value for --bg must be within 0-255")<<'\n';
            return {};
        }

        return Args{
            .input_filename  = inputs.front(),
            .output_filename = output_filename,
            .cols            = cols,
            .palette         = palette,
            .bg              = static_cast<unsigned char>(args["bg"].as<int>()),
            .invert          = static_cast<bool>(args.count("invert")),
        };
    }
    catch(const std::exception & e)
    {
        std::cerr<<help(e.what())<<'\n';
        return {};
    }
}
