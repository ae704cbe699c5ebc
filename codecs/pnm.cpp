#include "pnm.hpp"

#include <bitset>
#include <limits>
#include <stdexcept>
#include <string>

#include <cctype>
#include <cstdint>

#include "binio.hpp"

static std::string read_skip_comments(std::istream & in)
{
    std::string str;
    in >> str;
    while(str[0] == '#')
    {
        in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        in >> str;
    }

    // a comment can start right after a value, with no space in between
    if(auto comment = str.find('#'); comment != std::string::npos)
    {
        in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        str.resize(comment);
    }
    return str;
}

static std::uint16_t read_val(std::istream & in)
{
    try
    {
        std::size_t len {0};
        auto str = read_skip_comments(in);
        auto val = std::stol(str, &len);
        if(len != std::size(str))
            throw std::invalid_argument{""};
        if(val < std::numeric_limits<std::uint16_t>::min() || val > std::numeric_limits<std::uint16_t>::max())
            throw std::out_of_range{""};

        return static_cast<std::uint16_t>(val);
    }
    catch(const std::invalid_argument&)
    {
        throw std::runtime_error{"Error reading PNM: value invalid"};
    }
    catch(const std::out_of_range&)
    {
        throw std::runtime_error{"Error reading PNM: value out of range"};
    }
}

static std::uint16_t read_max_val(std::istream & in)
{
    auto max_val = read_val(in);
    if(max_val == 0)
        throw std::runtime_error{"Error reading PNM: max value must be positive"};
    return max_val;
}

// raw formats have exactly one whitespace char between the header and the data
static void skip_header_end(std::istream & in)
{
    if(!std::isspace(in.get()))
        throw std::runtime_error{"Error reading PNM: missing whitespace after header"};
}

static unsigned char rescale(std::uint16_t v, std::uint16_t max_val)
{
    if(v > max_val)
        throw std::runtime_error{"Error reading PNM: pixel value out of range"};

    return static_cast<unsigned char>((std::uint32_t{v} * 255u + max_val / 2u) / max_val);
}

void Pnm::open(std::istream & input)
{
    input.exceptions(std::ios_base::badbit | std::ios_base::failbit);
    try
    {
        std::string type;
        input >> type;

        std::size_t width {0}, height {0};
        try
        {
            width = std::stoull(read_skip_comments(input));
            height = std::stoull(read_skip_comments(input));
        }
        catch(const std::invalid_argument&)
        {
            throw std::runtime_error{"Error reading PNM: dimensions invalid"};
        }
        catch(const std::out_of_range&)
        {
            throw std::runtime_error{"Error reading PNM: dimensions out of range"};
        }

        set_size(width, height);

        if(type == "P1")
            read_P1(input);
        else if(type == "P2")
            read_P2(input);
        else if(type == "P3")
            read_P3(input);
        else if(type == "P4")
            read_P4(input);
        else if(type == "P5")
            read_P5(input);
        else if(type == "P6")
            read_P6(input);
        else
            throw std::runtime_error{"Error reading PNM: unknown type: " + type};
    }
    catch(std::ios_base::failure&)
    {
        input.exceptions(std::ios_base::goodbit);
        if(input.bad())
            throw std::runtime_error{"Error reading PNM: could not read file"};
        else
            throw std::runtime_error{"Error reading PNM: unexpected end of file"};
    }
    input.exceptions(std::ios_base::goodbit);
}

void Pnm::read_P1(std::istream & input)
{
    for(std::size_t row = 0; row < height_; ++row)
    {
        for(std::size_t col = 0; col < width_; ++col)
        {
            int v = 0;
            do
            {
                v = input.get();
                if(v == '#')
                {
                    input.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
                    v = ' ';
                }
            } while(std::isspace(v));

            switch(v)
            {
            case '0':
                image_data_[row][col] = Color{0xFF};
                break;
            case '1':
                image_data_[row][col] = Color{0x00};
                break;
            default:
                throw std::runtime_error{"Error reading PBM: unknown character: " + std::string{static_cast<char>(v)}};
            }
        }
    }
}

void Pnm::read_P2(std::istream & input)
{
    auto max_val = read_max_val(input);

    for(std::size_t row = 0; row < height_; ++row)
    {
        for(std::size_t col = 0; col < width_; ++col)
            image_data_[row][col] = Color{rescale(read_val(input), max_val)};
    }
}

void Pnm::read_P3(std::istream & input)
{
    auto max_val = read_max_val(input);

    for(std::size_t row = 0; row < height_; ++row)
    {
        for(std::size_t col = 0; col < width_; ++col)
        {
            auto r = rescale(read_val(input), max_val);
            auto g = rescale(read_val(input), max_val);
            auto b = rescale(read_val(input), max_val);

            image_data_[row][col] = Color{r, g, b};
        }
    }
}

void Pnm::read_P4(std::istream & input)
{
    skip_header_end(input);

    // rows are padded to a whole byte
    std::vector<unsigned char> rowbuf((width_ + 7) / 8);
    for(std::size_t row = 0; row < height_; ++row)
    {
        input.read(reinterpret_cast<char *>(std::data(rowbuf)), std::size(rowbuf));
        for(std::size_t col = 0; col < width_; ++col)
        {
            std::bitset<8> bits = rowbuf[col / 8];
            image_data_[row][col] = bits.test(7 - col % 8) ? Color{0x00} : Color{0xFF};
        }
    }
}

void Pnm::read_P5(std::istream & input)
{
    auto max_val = read_max_val(input);
    skip_header_end(input);

    for(std::size_t row = 0; row < height_; ++row)
    {
        for(std::size_t col = 0; col < width_; ++col)
        {
            // samples wider than a byte are big-endian
            std::uint16_t v = max_val <= std::numeric_limits<std::uint8_t>::max()
                ? readb<std::uint8_t>(input)
                : readb<std::uint16_t>(input, std::endian::big);

            image_data_[row][col] = Color{rescale(v, max_val)};
        }
    }
}

void Pnm::read_P6(std::istream & input)
{
    auto max_val = read_max_val(input);
    skip_header_end(input);

    auto read_sample = [&input, max_val]()
    {
        std::uint16_t v = max_val <= std::numeric_limits<std::uint8_t>::max()
            ? readb<std::uint8_t>(input)
            : readb<std::uint16_t>(input, std::endian::big);
        return rescale(v, max_val);
    };

    for(std::size_t row = 0; row < height_; ++row)
    {
        for(std::size_t col = 0; col < width_; ++col)
        {
            auto r = read_sample();
            auto g = read_sample();
            auto b = read_sample();

            image_data_[row][col] = Color{r, g, b};
        }
    }
}
