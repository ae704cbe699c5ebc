#include <gtest/gtest.h>

#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "asciiart.hpp"
#include "test_util.hpp"

static std::vector<std::string> split_rows(const std::string & art)
{
    std::vector<std::string> rows;
    std::istringstream in{art};
    for(std::string line; std::getline(in, line);)
        rows.push_back(line);
    return rows;
}

static std::string art_of(const Render_result & result)
{
    if(auto error = std::get_if<Render_error>(&result))
        ADD_FAILURE() << "render failed (" << to_string(error->kind) << "): " << error->message;
    return std::get<std::string>(result);
}

static Render_error::Kind error_kind(const Render_result & result)
{
    EXPECT_TRUE(std::holds_alternative<Render_error>(result));
    return std::get<Render_error>(result).kind;
}

TEST(OutputRows, CorrectsForCharAspect)
{
    EXPECT_EQ(output_rows(200, 100, 80), 22u);
    EXPECT_EQ(output_rows(100, 100, 80), 44u);
    EXPECT_EQ(output_rows(100, 200, 10), 11u);
}

TEST(OutputRows, ClampsToOneRow)
{
    EXPECT_EQ(output_rows(1000, 10, 80), 1u); // floor(80 * 0.01 * 0.55) == 0
    EXPECT_EQ(output_rows(1, 1, 1), 1u);
}

TEST(OutputRows, RejectsEmptyImage)
{
    EXPECT_THROW(static_cast<void>(output_rows(0, 10, 80)), std::invalid_argument);
}

TEST(PaletteIndex, Endpoints)
{
    EXPECT_EQ(palette_index(0, 10), 0u);
    EXPECT_EQ(palette_index(255, 10), 9u);
    EXPECT_EQ(palette_index(128, 10), 5u);
    EXPECT_EQ(palette_index(25, 10), 0u);
    EXPECT_EQ(palette_index(26, 10), 1u);
}

TEST(PaletteIndex, Monotonic)
{
    for(std::size_t size = 1; size <= 300; ++size)
    {
        std::size_t prev = 0;
        for(int p = 0; p < 256; ++p)
        {
            auto idx = palette_index(static_cast<unsigned char>(p), size);
            ASSERT_LT(idx, size);
            ASSERT_GE(idx, prev) << "intensity " << p << ", palette size " << size;
            prev = idx;
        }
    }
}

TEST(PaletteIndex, SingleEntry)
{
    for(int p = 0; p < 256; ++p)
        EXPECT_EQ(palette_index(static_cast<unsigned char>(p), 1), 0u);
}

TEST(PaletteIndex, RejectsEmptyPalette)
{
    EXPECT_THROW(static_cast<void>(palette_index(0, 0)), std::invalid_argument);
}

TEST(ImageToAscii, SolidColors)
{
    EXPECT_EQ(image_to_ascii(solid_image(4, 8, Color{0x00}), 4, default_palette), "    \n    \n    \n    \n");
    EXPECT_EQ(image_to_ascii(solid_image(4, 8, Color{0xFF}), 4, default_palette), "@@@@\n@@@@\n@@@@\n@@@@\n");
}

TEST(ImageToAscii, GradientLeftToRight)
{
    auto art = image_to_ascii(gradient_image(100, 50), 10, default_palette);
    auto rows = split_rows(art);

    ASSERT_EQ(std::size(rows), output_rows(100, 50, 10));
    for(auto && row: rows)
    {
        ASSERT_EQ(std::size(row), 10u);
        EXPECT_EQ(row.front(), ' ');
        EXPECT_EQ(row.back(), '@');
        for(std::size_t i = 1; i < std::size(row); ++i)
            EXPECT_LE(default_palette.find(row[i - 1]), default_palette.find(row[i]));
    }
}

TEST(ImageToAscii, TransparentPixelsUseBackground)
{
    auto img = solid_image(2, 2, Color{0xFF, 0xFF, 0xFF, 0x00});

    EXPECT_EQ(image_to_ascii(img, 2, default_palette, {.bg = 0x00}), "  \n");
    EXPECT_EQ(image_to_ascii(img, 2, default_palette, {.bg = 0xFF}), "@@\n");
}

TEST(ImageToAscii, Invert)
{
    auto img = solid_image(2, 2, Color{0x00});

    EXPECT_EQ(image_to_ascii(img, 2, default_palette, {.invert = true}), "@@\n");
}

TEST(ImageToAscii, RejectsBadParameters)
{
    auto img = solid_image(2, 2, Color{0x80});

    EXPECT_THROW(static_cast<void>(image_to_ascii(img, 0, default_palette)), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(image_to_ascii(img, 2, "")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(image_to_ascii(img, max_image_pixels + 1, default_palette)), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(image_to_ascii(img, 20'000, default_palette)), std::invalid_argument);
}

class Render: public testing::Test
{
protected:
    Temp_dir dir;
};

TEST_F(Render, AspectScaling)
{
    auto path = dir.write("wide.bmp", make_bmp24(gradient_image(200, 100)));

    auto rows = split_rows(art_of(render(path, 80, default_palette)));

    ASSERT_EQ(std::size(rows), 22u);
    for(auto && row: rows)
        EXPECT_EQ(std::size(row), 80u);
}

TEST_F(Render, RowShapeAndPaletteClosure)
{
    const std::string palette = "abcdefg";
    auto path = dir.write("gradient.ppm", make_ppm(gradient_image(37, 91)));

    for(int cols: {1, 7, 37, 100})
    {
        auto art = art_of(render(path, cols, palette));

        ASSERT_FALSE(std::empty(art));
        EXPECT_EQ(art.back(), '\n');

        auto rows = split_rows(art);
        EXPECT_EQ(std::size(rows), output_rows(37, 91, cols));
        for(auto && row: rows)
        {
            EXPECT_EQ(std::size(row), static_cast<std::size_t>(cols));
            for(auto c: row)
                EXPECT_NE(palette.find(c), std::string::npos) << "unexpected char '" << c << "'";
        }
    }
}

TEST_F(Render, Deterministic)
{
    auto path = dir.write("gradient.bmp", make_bmp24(gradient_image(64, 48)));

    auto first = art_of(render(path, 33));
    for(int i = 0; i < 5; ++i)
        EXPECT_EQ(art_of(render(path, 33)), first);
}

TEST_F(Render, SinglePixel)
{
    auto path = dir.write("pixel.bmp", make_bmp24(solid_image(1, 1, Color{0xFF})));

    EXPECT_EQ(art_of(render(path, 1)), "@\n");
}

TEST_F(Render, PaletteOfOne)
{
    auto path = dir.write("gradient.ppm", make_ppm(gradient_image(50, 50)));

    auto art = art_of(render(path, 20, "#"));

    std::set<char> chars(std::begin(art), std::end(art));
    EXPECT_EQ(chars, (std::set<char>{'#', '\n'}));
}

TEST_F(Render, PanoramaGetsOneRow)
{
    auto path = dir.write("panorama.ppm", make_ppm(gradient_image(1000, 10)));

    auto rows = split_rows(art_of(render(path, 80)));
    ASSERT_EQ(std::size(rows), 1u);
    EXPECT_EQ(std::size(rows.front()), 80u);
}

TEST_F(Render, DefaultWidthAndPalette)
{
    auto path = dir.write("gray.bmp", make_bmp24(solid_image(160, 160, Color{0xFF})));

    auto rows = split_rows(art_of(render(path)));
    ASSERT_EQ(std::size(rows), 44u);
    EXPECT_EQ(rows.front(), std::string(80, '@'));
}

TEST_F(Render, MissingFile)
{
    auto result = render((dir.path() / "does_not_exist.png").string(), 80, default_palette);
    EXPECT_EQ(error_kind(result), Render_error::Kind::NOT_FOUND);
    EXPECT_NE(std::get<Render_error>(result).message.find("does_not_exist.png"), std::string::npos);
}

TEST_F(Render, EmptyPathAndDirectoryAreNotFound)
{
    EXPECT_EQ(error_kind(render("", 80)), Render_error::Kind::NOT_FOUND);
    EXPECT_EQ(error_kind(render(dir.path().string(), 80)), Render_error::Kind::NOT_FOUND);
}

TEST_F(Render, InvalidParameters)
{
    auto path = dir.write("pixel.bmp", make_bmp24(solid_image(1, 1, Color{0xFF})));

    EXPECT_EQ(error_kind(render(path, 0)), Render_error::Kind::INVALID_PARAMETER);
    EXPECT_EQ(error_kind(render(path, -80)), Render_error::Kind::INVALID_PARAMETER);
    EXPECT_EQ(error_kind(render(path, 80, "")), Render_error::Kind::INVALID_PARAMETER);
}

TEST_F(Render, UndecodableFiles)
{
    EXPECT_EQ(error_kind(render(dir.write("empty.png", ""), 80)), Render_error::Kind::DECODE_ERROR);
    EXPECT_EQ(error_kind(render(dir.write("text.png", "this is not an image at all"), 80)), Render_error::Kind::DECODE_ERROR);

    auto truncated = make_bmp24(gradient_image(20, 20));
    truncated.resize(std::size(truncated) / 2);
    auto result = render(dir.write("truncated.bmp", truncated), 80);
    EXPECT_EQ(error_kind(result), Render_error::Kind::DECODE_ERROR);
    EXPECT_NE(std::get<Render_error>(result).message.find("BMP"), std::string::npos);
}

TEST_F(Render, WideOutput)
{
    auto path = dir.write("wide.bmp", make_bmp24(gradient_image(200, 100)));

    auto rows = split_rows(art_of(render(path, 2000)));
    ASSERT_EQ(std::size(rows), 550u);
    for(auto && row: rows)
        EXPECT_EQ(std::size(row), 2000u);
}

TEST_F(Render, OutputTooLargeIsInvalidParameter)
{
    auto path = dir.write("wide.bmp", make_bmp24(gradient_image(200, 100)));

    for(int cols: {std::numeric_limits<int>::max(), 1'000'000})
    {
        auto result = render(path, cols);
        EXPECT_EQ(error_kind(result), Render_error::Kind::INVALID_PARAMETER) << "cols " << cols;
    }
}

TEST_F(Render, ImageTooLargeIsDecodeError)
{
    // a header claiming 400 megapixels, with no pixel data behind it
    auto result = render(dir.write("huge.pgm", "P5 20000 20000 255\n"), 80);

    EXPECT_EQ(error_kind(result), Render_error::Kind::DECODE_ERROR);
    EXPECT_NE(std::get<Render_error>(result).message.find("Image too large"), std::string::npos);
}

TEST(RenderErrorKind, ToString)
{
    EXPECT_EQ(to_string(Render_error::Kind::NOT_FOUND), "not found");
    EXPECT_EQ(to_string(Render_error::Kind::DECODE_ERROR), "decode error");
    EXPECT_EQ(to_string(Render_error::Kind::INVALID_PARAMETER), "invalid parameter");
}
