#include "png.hpp"

#include <stdexcept>
#include <string>

#include <csetjmp>

#include <png.h>

struct Libpng
{
    png_structp png_ptr{nullptr};
    png_infop info_ptr{nullptr};
    std::string error_msg {"Generic error"};

    Libpng()
    {
        png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, this, error_fn, warning_fn);
        if(!png_ptr)
            throw std::runtime_error{"Error initializing libpng"};

        info_ptr = png_create_info_struct(png_ptr);
        if(!info_ptr)
        {
            png_destroy_read_struct(&png_ptr, nullptr, nullptr);
            throw std::runtime_error{"Error initializing libpng info"};
        }
    }
    ~Libpng()
    {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    }

    Libpng(const Libpng &) = delete;
    Libpng & operator=(const Libpng &) = delete;

    operator png_structp() { return png_ptr; }
    operator png_infop() { return info_ptr; }

private:
    // keep libpng's message instead of letting it print to stderr
    static void error_fn(png_structp png_ptr, png_const_charp msg)
    {
        if(auto libpng = static_cast<Libpng *>(png_get_error_ptr(png_ptr)); libpng)
            libpng->error_msg = msg;
        png_longjmp(png_ptr, 1);
    }
    static void warning_fn(png_structp, png_const_charp) {}
};

static void read_fn(png_structp png_ptr, png_bytep data, png_size_t length) noexcept
{
    auto input = static_cast<std::istream *>(png_get_io_ptr(png_ptr));

    input->read(reinterpret_cast<char *>(data), length);
    if(input->bad())
        png_error(png_ptr, "could not read file");
    else if(static_cast<png_size_t>(input->gcount()) != length)
        png_error(png_ptr, "unexpected end of file");
}

void Png::open(std::istream & input)
{
    Libpng libpng;

    // libpng longjmps here on error. Nothing with a destructor may be created
    // in this function after this point
    if(setjmp(png_jmpbuf(libpng.png_ptr)))
        throw std::runtime_error{"Error reading PNG: " + libpng.error_msg};

    png_set_read_fn(libpng, &input, read_fn);

    // don't care about non-image data
    png_set_keep_unknown_chunks(libpng, PNG_HANDLE_CHUNK_NEVER, nullptr, 0);

    png_read_info(libpng, libpng);

    auto bit_depth = png_get_bit_depth(libpng, libpng);
    auto color_type = png_get_color_type(libpng, libpng);

    // set transformations to convert to 32-bit RGBA
    if(color_type == PNG_COLOR_TYPE_PALETTE)
        png_set_palette_to_rgb(libpng);

    if(color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8)
        png_set_expand_gray_1_2_4_to_8(libpng);

    if(png_get_valid(libpng, libpng, PNG_INFO_tRNS))
        png_set_tRNS_to_alpha(libpng);

    if(color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA)
        png_set_gray_to_rgb(libpng);

    if(bit_depth == 16)
        png_set_strip_16(libpng);

    if(bit_depth < 8)
        png_set_packing(libpng);

    png_set_add_alpha(libpng, 0xFF, PNG_FILLER_AFTER);

    auto number_of_passes = png_set_interlace_handling(libpng);
    png_read_update_info(libpng, libpng);

    set_size(png_get_image_width(libpng, libpng), png_get_image_height(libpng, libpng));

    if(png_get_rowbytes(libpng, libpng) != width_ * sizeof(Color))
        png_error(libpng, "bytes per row incorrect");

    // interlaced images get combined into the same rows on each pass
    for(decltype(number_of_passes) pass = 0; pass < number_of_passes; ++pass)
    {
        for(std::size_t row = 0; row < height_; ++row)
            png_read_row(libpng, row_buffer(row), nullptr);
    }

    png_read_end(libpng, nullptr);
}
