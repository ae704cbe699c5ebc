#include "asciiart.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>

#include <cerrno>
#include <cmath>
#include <cstring>

[[nodiscard]] std::string_view to_string(Render_error::Kind kind)
{
    switch(kind)
    {
    case Render_error::Kind::NOT_FOUND:         return "not found";
    case Render_error::Kind::DECODE_ERROR:      return "decode error";
    case Render_error::Kind::INVALID_PARAMETER: return "invalid parameter";
    }
    return "unknown error";
}

[[nodiscard]] std::size_t output_rows(std::size_t img_width, std::size_t img_height, std::size_t cols)
{
    if(img_width == 0)
        throw std::invalid_argument{"Image width must be positive"};

    auto aspect_ratio = static_cast<double>(img_height) / static_cast<double>(img_width);
    auto exact_rows = std::floor(static_cast<double>(cols) * aspect_ratio * char_aspect);
    if(exact_rows >= static_cast<double>(std::numeric_limits<std::size_t>::max()))
        throw std::out_of_range{"Output row count out of range"};

    auto rows = static_cast<std::size_t>(exact_rows);

    // very wide, short images would otherwise round down to nothing
    return std::max(rows, std::size_t{1});
}

[[nodiscard]] std::size_t palette_index(unsigned char intensity, std::size_t palette_size)
{
    if(palette_size == 0)
        throw std::invalid_argument{"Palette must not be empty"};

    return std::min(std::size_t{intensity} * palette_size / 256, palette_size - 1);
}

[[nodiscard]] std::string image_to_ascii(const Image & img, std::size_t cols, std::string_view palette, const Render_options & options)
{
    if(cols == 0)
        throw std::invalid_argument{"Output width must be positive"};
    if(std::empty(palette))
        throw std::invalid_argument{"Palette must not be empty"};

    const auto rows = output_rows(img.get_width(), img.get_height(), cols);
    if(cols > max_image_pixels || rows > max_image_pixels / cols)
        throw std::invalid_argument{"Output of " + std::to_string(cols) + "x" + std::to_string(rows) + " chars is too large"};

    const auto scaled_img = img.scale(cols, rows);

    std::string out;
    out.reserve((cols + 1) * rows);

    for(std::size_t row = 0; row < scaled_img.get_height(); ++row)
    {
        for(std::size_t col = 0; col < scaled_img.get_width(); ++col)
        {
            auto color = scaled_img[row][col];
            auto intensity = color.alpha_blend(options.bg).to_gray();
            if(options.invert)
                intensity = static_cast<unsigned char>(255 - intensity);

            out += palette[palette_index(intensity, std::size(palette))];
        }
        out += '\n';
    }

    return out;
}

[[nodiscard]] Render_result render(const std::string & path, int cols, std::string_view palette, const Render_options & options)
{
    if(cols <= 0)
        return Render_error{Render_error::Kind::INVALID_PARAMETER, "Output width must be positive, got " + std::to_string(cols)};
    if(std::empty(palette))
        return Render_error{Render_error::Kind::INVALID_PARAMETER, "Palette must not be empty"};

    if(std::empty(path))
        return Render_error{Render_error::Kind::NOT_FOUND, "No image path given"};

    std::error_code ec;
    if(!std::filesystem::exists(path, ec))
        return Render_error{Render_error::Kind::NOT_FOUND, "Image '" + path + "' not found"};
    if(!std::filesystem::is_regular_file(path, ec))
        return Render_error{Render_error::Kind::NOT_FOUND, "Image '" + path + "' is not a regular file"};

    std::ifstream input_file{path, std::ios_base::in | std::ios_base::binary};
    if(!input_file)
        return Render_error{Render_error::Kind::NOT_FOUND, "Could not open image '" + path + "': " + std::string{std::strerror(errno)}};

    std::unique_ptr<Image> img;
    try
    {
        img = open_image(input_file);
    }
    catch(const std::bad_alloc &)
    {
        return Render_error{Render_error::Kind::DECODE_ERROR, "Error reading '" + path + "': image too large"};
    }
    catch(const std::exception & e)
    {
        return Render_error{Render_error::Kind::DECODE_ERROR, "Error reading '" + path + "': " + e.what()};
    }

    // the image is valid from here on, so failures come from the requested output size
    try
    {
        return image_to_ascii(*img, static_cast<std::size_t>(cols), palette, options);
    }
    catch(const std::bad_alloc &)
    {
        return Render_error{Render_error::Kind::INVALID_PARAMETER, "Output width " + std::to_string(cols) + " is too large"};
    }
    catch(const std::exception & e)
    {
        return Render_error{Render_error::Kind::INVALID_PARAMETER, e.what()};
    }
}
