#ifndef IMAGE_HPP
#define IMAGE_HPP

#include <algorithm>
#include <array>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "../color.hpp"

// set to the size of the longest magic number
constexpr std::size_t max_header_len = 12; // 12 bytes needed to identify JPEGs

// larger images are rejected before any pixel storage is allocated
constexpr std::size_t max_image_pixels = 89'478'485; // 256MiB of 24-bit RGB, as Pillow uses

class Image
{
public:
    Image() = default;
    Image(std::size_t w, std::size_t h) { set_size(w, h); }

    virtual ~Image() = default;
    Image(const Image &) = default;
    Image & operator=(const Image &) = default;
    Image(Image &&) = default;
    Image & operator=(Image &&) = default;

    const std::vector<Color> & operator[](std::size_t i) const
    {
        return image_data_[i];
    }
    std::vector<Color> & operator[](std::size_t i)
    {
        return image_data_[i];
    }
    std::size_t get_width() const { return width_; }
    std::size_t get_height() const { return height_; }
    // throws std::runtime_error if w * h exceeds max_image_pixels
    void set_size(std::size_t w, std::size_t h);

    using Header = std::array<char, max_header_len>;
    static bool header_cmp(unsigned char a, char b);

    Image scale(std::size_t new_width, std::size_t new_height) const;

    // decoders override this to fill in the image from the input stream
    virtual void open(std::istream & input);

    // raw RGBA bytes of one row, for C decoders that write rows directly
    unsigned char * row_buffer(std::size_t row);
    const unsigned char * row_buffer(std::size_t row) const;

protected:
    std::size_t width_{0};
    std::size_t height_{0};
    std::vector<std::vector<Color>> image_data_;
};

// detect the format of input from its signature and decode it.
// input must be seekable. Throws std::runtime_error if the data can't be decoded
[[nodiscard]] std::unique_ptr<Image> open_image(std::istream & input);

#endif // IMAGE_HPP
