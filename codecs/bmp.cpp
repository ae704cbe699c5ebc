#include "bmp.hpp"

#include <bitset>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <cstdint>

#include "binio.hpp"

struct bmp_data
{
    std::uint32_t pixel_offset {0};
    std::size_t width{0};
    std::size_t height{0};
    bool bottom_to_top {true};
    std::uint16_t bpp {0};
    enum class Compression: std::uint32_t {BI_RGB=0, BI_RLE8=1, BI_RLE4=2, BI_BITFIELDS=3} compression{Compression::BI_RGB};
    std::uint32_t palette_size {0};
    std::uint32_t red_mask {0};
    std::uint32_t green_mask {0};
    std::uint32_t blue_mask {0};
    std::uint32_t alpha_mask {0};

    std::vector<Color> palette;

    const Color & lookup(std::size_t idx) const
    {
        if(idx >= std::size(palette))
            throw std::runtime_error{"Error reading BMP: palette index out of range: " + std::to_string(idx)};
        return palette[idx];
    }
};

// header dimensions are signed. A negative height marks top-to-bottom row order
template <typename T>
static std::size_t dimension(T val)
{
    if(val == std::numeric_limits<T>::min())
        throw std::runtime_error{"Error reading BMP: invalid dimensions"};
    return static_cast<std::size_t>(val < 0 ? -val : val);
}

static void read_bmp_file_header(std::istream & in, bmp_data & bmp, std::size_t & file_pos)
{
    in.ignore(10);
    readb(in, bmp.pixel_offset);
    file_pos += 14;
}

static void read_bmp_info_header(std::istream & in, bmp_data & bmp, std::size_t & file_pos)
{
    std::uint32_t header_size {0};
    readb(in, header_size);
    file_pos += 4;

    switch(header_size)
    {
        case 12: // BITMAPCOREHEADER
        {
            auto width = readb<std::int16_t>(in);
            auto height = readb<std::int16_t>(in);
            bmp.width = dimension(width);
            bmp.height = dimension(height);
            bmp.bottom_to_top = height >= 0;

            in.ignore(2); // planes
            readb(in, bmp.bpp);

            file_pos += 8;
            break;
        }
        case 40: // BITMAPINFOHEADER
        case 56: // BITMAPV3INFOHEADER
        case 108: // BITMAPV4HEADER
        case 124: // BITMAPV5HEADER
        {
            auto width = readb<std::int32_t>(in);
            auto height = readb<std::int32_t>(in);
            bmp.width = dimension(width);
            bmp.height = dimension(height);
            bmp.bottom_to_top = height >= 0;

            in.ignore(2); // planes
            readb(in, bmp.bpp);

            bmp.compression = static_cast<bmp_data::Compression>(readb<std::underlying_type_t<bmp_data::Compression>>(in));

            in.ignore(12); // image size, resolution
            readb(in, bmp.palette_size);
            in.ignore(4); // important colors

            file_pos += 36;

            if(header_size > 40) // V3+
            {
                readb(in, bmp.red_mask);
                readb(in, bmp.green_mask);
                readb(in, bmp.blue_mask);
                readb(in, bmp.alpha_mask);

                file_pos += 16;
            }
            break;
        }
        default:
            throw std::runtime_error {"Error reading BMP: unsupported header size: " + std::to_string(header_size)};
    }

    // skip to end of header
    in.ignore(14 + header_size - file_pos); // file header is 14 bytes
    file_pos = 14 + header_size;

    if(header_size == 40 && bmp.compression == bmp_data::Compression::BI_BITFIELDS)
    {
        readb(in, bmp.red_mask);
        readb(in, bmp.green_mask);
        readb(in, bmp.blue_mask);

        file_pos += 12;
    }

    if(bmp.bpp != 1 && bmp.bpp != 4 && bmp.bpp != 8 && bmp.bpp != 16 && bmp.bpp != 24 && bmp.bpp != 32)
        throw std::runtime_error {"Error reading BMP: unsupported bit depth: " + std::to_string(bmp.bpp)};

    if(bmp.bpp < 16 && bmp.palette_size > (std::uint32_t{1} << bmp.bpp))
        throw std::runtime_error {"Error reading BMP: invalid palette size: " + std::to_string(bmp.palette_size)};

    switch(bmp.compression)
    {
        case bmp_data::Compression::BI_RGB:
            break;
        case bmp_data::Compression::BI_BITFIELDS:
            if(bmp.bpp != 16 && bmp.bpp != 32)
                throw std::runtime_error {"Error reading BMP: BI_BITFIELDS not supported for bit depth: " + std::to_string(bmp.bpp)};
            break;
        case bmp_data::Compression::BI_RLE8:
            if(bmp.bpp != 8)
                throw std::runtime_error {"Error reading BMP: BI_RLE8 not supported for bit depth: " + std::to_string(bmp.bpp)};
            break;
        case bmp_data::Compression::BI_RLE4:
            if(bmp.bpp != 4)
                throw std::runtime_error {"Error reading BMP: BI_RLE4 not supported for bit depth: " + std::to_string(bmp.bpp)};
            break;
        default:
            throw std::runtime_error {"Error reading BMP: unsupported compression: " + std::to_string(static_cast<std::underlying_type_t<bmp_data::Compression>>(bmp.compression))};
    }

    if(bmp.bpp < 16)
    {
        bmp.palette.resize(bmp.palette_size == 0 ? std::uint32_t{1} << bmp.bpp : bmp.palette_size);

        // core headers store 3-byte BGR entries, later headers 4-byte BGRX
        const std::size_t entry_size = header_size == 12 ? 3 : 4;
        for(auto && i: bmp.palette)
        {
            unsigned char bgrx[4] {};
            in.read(reinterpret_cast<char *>(bgrx), entry_size);
            i = Color{bgrx[2], bgrx[1], bgrx[0]};
        }

        file_pos += std::size(bmp.palette) * entry_size;
    }

    // skip to pixel data (if we know the offset)
    if(bmp.pixel_offset != 0)
    {
        if(file_pos > bmp.pixel_offset)
            throw std::runtime_error {"Error reading BMP: invalid pixel offset value"};

        in.ignore(bmp.pixel_offset - file_pos);
        file_pos = bmp.pixel_offset;
    }
}

// extract a channel described by a BI_BITFIELDS mask, scaled to 8 bits
static unsigned char bitfield(std::uint32_t packed, std::uint32_t mask)
{
    if(mask == 0)
        return 0;

    auto shift = 0;
    for(; (mask & 0x1) == 0; ++shift)
        mask >>= 1;

    std::uint64_t val = (packed >> shift) & mask;

    return static_cast<unsigned char>(val * 255 / mask);
}

static void read_uncompressed(std::istream & in, const bmp_data & bmp, std::vector<std::vector<Color>> & image_data)
{
    std::vector<unsigned char> rowbuf((bmp.bpp * bmp.width + 31) / 32  * 4); // ceiling division
    for(std::size_t row = 0; row < bmp.height; ++row)
    {
        auto im_row = bmp.bottom_to_top ? bmp.height - row - 1 : row;
        in.read(reinterpret_cast<char *>(std::data(rowbuf)), std::size(rowbuf));

        for(std::size_t col = 0; col < bmp.width; ++col)
        {
            auto & pix = image_data[im_row][col];

            switch(bmp.bpp)
            {
                case 1:
                {
                    std::bitset<8> bits = rowbuf[col / 8];
                    pix = bmp.lookup(bits.test(7 - col % 8));
                    break;
                }
                case 4:
                {
                    auto packed = rowbuf[col / 2];
                    pix = bmp.lookup(col % 2 == 0 ? packed >> 4 : packed & 0xF);
                    break;
                }
                case 8:
                    pix = bmp.lookup(rowbuf[col]);
                    break;
                case 16:
                {
                    std::uint32_t packed = rowbuf[2 * col] | (rowbuf[2 * col + 1] << 8);
                    if(bmp.compression == bmp_data::Compression::BI_RGB)
                    {
                        // 5.5.5 format: xrrrrrgg gggbbbbb
                        pix = Color{bitfield(packed, 0x7C00), bitfield(packed, 0x03E0), bitfield(packed, 0x001F)};
                    }
                    else
                    {
                        pix = Color{bitfield(packed, bmp.red_mask), bitfield(packed, bmp.green_mask), bitfield(packed, bmp.blue_mask),
                                    bmp.alpha_mask ? bitfield(packed, bmp.alpha_mask) : static_cast<unsigned char>(0xFF)};
                    }
                    break;
                }
                case 24:
                    pix = Color{rowbuf[3 * col + 2], rowbuf[3 * col + 1], rowbuf[3 * col]};
                    break;
                case 32:
                {
                    std::uint32_t packed = static_cast<std::uint32_t>(rowbuf[4 * col])
                                         | static_cast<std::uint32_t>(rowbuf[4 * col + 1]) << 8
                                         | static_cast<std::uint32_t>(rowbuf[4 * col + 2]) << 16
                                         | static_cast<std::uint32_t>(rowbuf[4 * col + 3]) << 24;

                    if(bmp.compression == bmp_data::Compression::BI_RGB)
                    {
                        // 4th byte is reserved unless a V3+ header gives an alpha mask
                        pix = Color{rowbuf[4 * col + 2], rowbuf[4 * col + 1], rowbuf[4 * col],
                                    bmp.alpha_mask ? bitfield(packed, bmp.alpha_mask) : static_cast<unsigned char>(0xFF)};
                    }
                    else
                    {
                        pix = Color{bitfield(packed, bmp.red_mask), bitfield(packed, bmp.green_mask), bitfield(packed, bmp.blue_mask),
                                    bmp.alpha_mask ? bitfield(packed, bmp.alpha_mask) : static_cast<unsigned char>(0xFF)};
                    }
                    break;
                }
            }
        }
    }
}

static void read_rle(std::istream & in, const bmp_data & bmp, std::vector<std::vector<Color>> & image_data, std::size_t & file_pos)
{
    std::size_t row = 0, col = 0;

    auto put = [&](const Color & color)
    {
        if(row >= bmp.height || col >= bmp.width)
            throw std::runtime_error {"Error reading BMP: RLE data out of range"};

        image_data[bmp.bottom_to_top ? bmp.height - row - 1 : row][col++] = color;
    };

    auto get = [&in, &file_pos]()
    {
        ++file_pos;
        return static_cast<unsigned char>(in.get());
    };

    while(true)
    {
        auto count = get();

        if(count == 0)
        {
            auto escape = get();

            if(escape == 0) // end of line
            {
                col = 0;
                ++row;
            }
            else if(escape == 1) // end of bitmap
            {
                break;
            }
            else if(escape == 2) // delta
            {
                col += get();
                row += get();
            }
            else // absolute mode
            {
                unsigned char idx {0};
                for(auto i = 0; i < escape; ++i)
                {
                    if(bmp.bpp == 4)
                    {
                        if(i % 2 == 0)
                            idx = get();
                        put(bmp.lookup(i % 2 == 0 ? idx >> 4 : idx & 0xF));
                    }
                    else
                    {
                        put(bmp.lookup(get()));
                    }
                }

                // runs are padded to a word boundary
                if(file_pos % 2 != 0)
                    get();
            }
        }
        else
        {
            auto idx = get();
            for(auto i = 0; i < count; ++i)
            {
                if(bmp.bpp == 4)
                    put(bmp.lookup(i % 2 == 0 ? idx >> 4 : idx & 0xF));
                else
                    put(bmp.lookup(idx));
            }
        }
    }
}

void Bmp::open(std::istream & input)
{
    input.exceptions(std::ios_base::badbit | std::ios_base::failbit);
    try
    {
        std::size_t file_pos {0}; // tellg() isn't reliable on every stream, so track position by hand

        bmp_data bmp;
        read_bmp_file_header(input, bmp, file_pos);
        read_bmp_info_header(input, bmp, file_pos);

        set_size(bmp.width, bmp.height);

        if(bmp.compression == bmp_data::Compression::BI_RLE8 || bmp.compression == bmp_data::Compression::BI_RLE4)
            read_rle(input, bmp, image_data_, file_pos);
        else
            read_uncompressed(input, bmp, image_data_);
    }
    catch(std::ios_base::failure&)
    {
        input.exceptions(std::ios_base::goodbit);
        if(input.bad())
            throw std::runtime_error{"Error reading BMP: could not read file"};
        else
            throw std::runtime_error{"Error reading BMP: unexpected end of file"};
    }
    input.exceptions(std::ios_base::goodbit);
}
