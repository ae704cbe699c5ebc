// Convert an image input to ascii art
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <variant>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "args.hpp"
#include "asciiart.hpp"

static void write_output(const std::string & art, const std::string & output_filename)
{
    std::ofstream output_file;
    if(output_filename != "-")
        output_file.open(output_filename);
    std::ostream & out = output_filename == "-" ? std::cout : output_file;

    if(!out)
        throw std::runtime_error{"Could not open output file (" + output_filename + "): " + std::string{std::strerror(errno)}};

    out<<art<<std::flush;

    if(!out)
        throw std::runtime_error{"Could not write output" + (output_filename == "-" ? std::string{} : " (" + output_filename + ")")};
}

int main(int argc, char * argv[])
{
    auto args = parse_args(argc, argv);
    if(!args)
        return EXIT_FAILURE;

    auto result = render(args->input_filename, args->cols, args->palette, Render_options{.bg = args->bg, .invert = args->invert});

    if(auto error = std::get_if<Render_error>(&result))
    {
        std::cerr<<"Error: "<<error->message<<'\n';
        return EXIT_FAILURE;
    }

    try
    {
        write_output(std::get<std::string>(result), args->output_filename);
    }
    catch(const std::runtime_error & e)
    {
        std::cerr<<e.what()<<'\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
