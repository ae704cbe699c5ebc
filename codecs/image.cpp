#include "image.hpp"

#include <array>
#include <stdexcept>
#include <string>

#include <cmath>
#include <cstdint>

#include "bmp.hpp"
#include "gif.hpp"
#include "jpeg.hpp"
#include "png.hpp"
#include "pnm.hpp"

bool Image::header_cmp(unsigned char a, char b){ return a == static_cast<unsigned char>(b); };

void Image::set_size(std::size_t w, std::size_t h)
{
    if(w > max_image_pixels || h > max_image_pixels || (w != 0 && h > max_image_pixels / w))
        throw std::runtime_error{"Image too large: " + std::to_string(w) + "x" + std::to_string(h)};

    width_ = w; height_ = h;
    image_data_.resize(height_);
    for(auto && row: image_data_)
        row.resize(width_);
}

unsigned char * Image::row_buffer(std::size_t row)
{
    return reinterpret_cast<unsigned char *>(std::data(image_data_[row]));
}

const unsigned char * Image::row_buffer(std::size_t row) const
{
    return reinterpret_cast<const unsigned char *>(std::data(image_data_[row]));
}

void Image::open(std::istream &)
{
    throw std::runtime_error{"Image type can't be read"};
}

Image Image::scale(std::size_t new_width, std::size_t new_height) const
{
    if(width_ == 0 || height_ == 0)
        throw std::runtime_error{"Can't scale an empty image"};

    Image new_img(new_width, new_height);

    for(std::size_t new_row = 0; new_row < new_height; ++new_row)
    {
        // each output cell covers at least one source pixel, so enlarging acts like nearest-neighbor
        const auto row_begin = new_row * height_ / new_height;
        const auto row_end   = std::max(row_begin + 1, (new_row + 1) * height_ / new_height);

        for(std::size_t new_col = 0; new_col < new_width; ++new_col)
        {
            const auto col_begin = new_col * width_ / new_width;
            const auto col_end   = std::max(col_begin + 1, (new_col + 1) * width_ / new_width);

            std::uint64_t r_sum = 0, g_sum = 0, b_sum = 0, a_sum = 0;

            for(auto y = row_begin; y < row_end; ++y)
            {
                for(auto x = col_begin; x < col_end; ++x)
                {
                    const auto & pix = image_data_[y][x];

                    r_sum += pix.r * pix.r;
                    g_sum += pix.g * pix.g;
                    b_sum += pix.b * pix.b;
                    a_sum += pix.a * pix.a;
                }
            }

            const auto cell_count = static_cast<double>((row_end - row_begin) * (col_end - col_begin));

            // RMS average. Clamp guards against rounding past 255
            auto rms = [cell_count](std::uint64_t sum)
            {
                return static_cast<unsigned char>(std::min(std::lround(std::sqrt(static_cast<double>(sum) / cell_count)), 255l));
            };

            new_img.image_data_[new_row][new_col] = Color{rms(r_sum), rms(g_sum), rms(b_sum), rms(a_sum)};
        }
    }

    return new_img;
}

[[nodiscard]] std::unique_ptr<Image> open_image(std::istream & input)
{
    Image::Header header {};

    input.read(std::data(header), std::size(header));
    if(input.bad())
        throw std::runtime_error{"Could not read file header"};

    // short files are fine (tiny PNMs can be under 12 bytes), empty ones are not
    if(input.gcount() == 0)
        throw std::runtime_error{"Could not read file header: file is empty"};

    input.clear();
    input.seekg(0);
    if(!input)
        throw std::runtime_error{"Unable to rewind stream"};

    std::unique_ptr<Image> img;
    if(is_bmp(header))
    {
        img = std::make_unique<Bmp>();
    }
    else if(is_gif(header))
    {
        #ifdef GIF_FOUND
        img = std::make_unique<Gif>();
        #else
        throw std::runtime_error{"Not compiled with GIF support"};
        #endif
    }
    else if(is_jpeg(header))
    {
        #ifdef JPEG_FOUND
        img = std::make_unique<Jpeg>();
        #else
        throw std::runtime_error{"Not compiled with JPEG support"};
        #endif
    }
    else if(is_png(header))
    {
        #ifdef PNG_FOUND
        img = std::make_unique<Png>();
        #else
        throw std::runtime_error{"Not compiled with PNG support"};
        #endif
    }
    else if(is_pnm(header))
    {
        img = std::make_unique<Pnm>();
    }
    else
    {
        throw std::runtime_error{"Unknown input file format"};
    }

    img->open(input);

    if(img->get_width() == 0 || img->get_height() == 0)
        throw std::runtime_error{"Image has no pixels"};

    return img;
}
