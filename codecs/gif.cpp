#include "gif.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include <gif_lib.h>

// giflib is a very poorly designed library. Its documentation is even worse

static int read_fn(GifFileType* gif_file, GifByteType * data, int length) noexcept
{
    auto in = static_cast<std::istream *>(gif_file->UserData);
    if(!in)
        return GIF_ERROR;

    in->read(reinterpret_cast<char *>(data), length);
    if(in->bad())
        return GIF_ERROR;

    return static_cast<int>(in->gcount());
}

struct Gif_closer
{
    void operator()(GifFileType * gif) const noexcept
    {
        int error_code = GIF_OK;
        DGifCloseFile(gif, &error_code);
    }
};

void Gif::open(std::istream & input)
{
    int error_code = GIF_OK;
    auto gif = std::unique_ptr<GifFileType, Gif_closer>{DGifOpen(&input, read_fn, &error_code)};
    if(!gif)
        throw std::runtime_error{"Error reading GIF: " + std::string{GifErrorString(error_code)}};

    if(DGifSlurp(gif.get()) != GIF_OK)
        throw std::runtime_error{"Error reading GIF: " + std::string{GifErrorString(gif->Error)}};

    if(gif->ImageCount < 1)
        throw std::runtime_error{"Error reading GIF: no images in file"};

    set_size(gif->SWidth, gif->SHeight);

    // default all pixels to transparent
    for(auto && row: image_data_)
    {
        for(auto && pix: row)
            pix = Color{0, 0, 0, 0};
    }

    // later frames are animation, so only the first is composited
    const auto & frame = gif->SavedImages[0];

    auto pal = frame.ImageDesc.ColorMap;
    if(!pal)
    {
        pal = gif->SColorMap;
        if(!pal)
            throw std::runtime_error{"Error reading GIF: could not find color map"};
    }

    int transparency_ind = NO_TRANSPARENT_COLOR;
    GraphicsControlBlock gcb;
    if(DGifSavedExtensionToGCB(gif.get(), 0, &gcb) == GIF_OK)
        transparency_ind = gcb.TransparentColor;

    auto left = static_cast<std::size_t>(frame.ImageDesc.Left);
    auto top = static_cast<std::size_t>(frame.ImageDesc.Top);
    auto sub_width = static_cast<std::size_t>(frame.ImageDesc.Width);
    auto sub_height = static_cast<std::size_t>(frame.ImageDesc.Height);

    if(left + sub_width > width_ || top + sub_height > height_)
        throw std::runtime_error{"Error reading GIF: frame has wrong size or offset"};

    const auto & im = frame.RasterBits;

    for(std::size_t row = 0; row < sub_height; ++row)
    {
        for(std::size_t col = 0; col < sub_width; ++col)
        {
            auto index = im[row * sub_width + col];

            if(index == transparency_ind)
                continue;

            if(index >= pal->ColorCount)
                throw std::runtime_error{"Error reading GIF: color index out of range"};

            auto & pal_color = pal->Colors[index];
            image_data_[row + top][col + left] = Color{pal_color.Red, pal_color.Green, pal_color.Blue};
        }
    }
}
