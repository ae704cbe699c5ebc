#ifndef ARGS_HPP
#define ARGS_HPP

#include <optional>
#include <string>

#include "config.h"

struct Args
{
    std::string input_filename;
    std::string output_filename; // - for stdout
    int cols;                    // output cols
    std::string palette;         // chars, darkest first
    unsigned char bg;            // BG color value
    bool invert;                 // invert colors
};

[[nodiscard]] std::optional<Args> parse_args(int argc, char * argv[]);

#endif // ARGS_HPP
