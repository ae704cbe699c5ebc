#ifndef ASCIIART_HPP
#define ASCIIART_HPP

#include <string>
#include <string_view>
#include <variant>

#include "codecs/image.hpp"

// index 0 is used for the darkest pixels, the last char for the brightest
inline constexpr std::string_view default_palette = " .:-=+*#%@";
inline constexpr int default_cols = 80;

// terminal character cells are roughly this much wider than they are tall
inline constexpr double char_aspect = 0.55;

struct Render_options
{
    unsigned char bg {0};  // gray level transparent pixels are blended onto
    bool invert {false};   // invert intensities before picking chars
};

struct Render_error
{
    enum class Kind {NOT_FOUND, DECODE_ERROR, INVALID_PARAMETER} kind;
    std::string message;
};

[[nodiscard]] std::string_view to_string(Render_error::Kind kind);

// on success, the ascii art: one '\n' terminated line per output row
using Render_result = std::variant<std::string, Render_error>;

// number of output rows for an image, at least 1
[[nodiscard]] std::size_t output_rows(std::size_t img_width, std::size_t img_height, std::size_t cols);

// which palette entry an intensity maps to. Splits 0-255 into palette_size equal buckets
[[nodiscard]] std::size_t palette_index(unsigned char intensity, std::size_t palette_size);

// convert an already decoded image. cols must be positive, palette non-empty, and the
// output grid no larger than max_image_pixels. Throws std::invalid_argument otherwise
[[nodiscard]] std::string image_to_ascii(const Image & img, std::size_t cols, std::string_view palette, const Render_options & options = {});

// load the image at path and convert it. Never throws; failures are returned as a Render_error
[[nodiscard]] Render_result render(const std::string & path, int cols = default_cols, std::string_view palette = default_palette, const Render_options & options = {});

#endif // ASCIIART_HPP
