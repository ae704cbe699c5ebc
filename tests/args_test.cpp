#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include <cstdlib>

#include "args.hpp"
#include "asciiart.hpp"
#include "test_util.hpp"

class Parse_args: public testing::Test
{
protected:
    void SetUp() override
    {
        if(auto columns = std::getenv("COLUMNS"); columns)
            saved_columns_ = columns;
        #ifdef HAS_UNISTD
        unsetenv("COLUMNS");
        #endif
    }

    void TearDown() override
    {
        #ifdef HAS_UNISTD
        if(saved_columns_)
            setenv("COLUMNS", saved_columns_->c_str(), 1);
        else
            unsetenv("COLUMNS");
        #endif
    }

    std::optional<Args> parse(std::vector<std::string> args)
    {
        args.insert(std::begin(args), "asciify");

        std::vector<char *> argv;
        for(auto && arg: args)
            argv.push_back(std::data(arg));
        argv.push_back(nullptr);

        return parse_args(static_cast<int>(std::size(args)), std::data(argv));
    }

    Temp_dir dir;
    std::string input = dir.write("in.ppm", make_ppm(gradient_image(4, 4)));

private:
    std::optional<std::string> saved_columns_;
};

TEST_F(Parse_args, Defaults)
{
    auto args = parse({input, "-o", (dir.path() / "out.txt").string()});

    ASSERT_TRUE(args);
    EXPECT_EQ(args->input_filename, input);
    EXPECT_EQ(args->cols, default_cols);
    EXPECT_EQ(args->palette, default_palette);
    EXPECT_EQ(args->bg, 0);
    EXPECT_FALSE(args->invert);
}

TEST_F(Parse_args, AllOptions)
{
    auto args = parse({"-c", "120", "-p", "ab", "-b", "200", "-i", "-o", "-", input});

    ASSERT_TRUE(args);
    EXPECT_EQ(args->cols, 120);
    EXPECT_EQ(args->palette, "ab");
    EXPECT_EQ(args->bg, 200);
    EXPECT_TRUE(args->invert);
    EXPECT_EQ(args->output_filename, "-");
}

TEST_F(Parse_args, Rejected)
{
    EXPECT_FALSE(parse({}));
    EXPECT_FALSE(parse({"-h"}));
    EXPECT_FALSE(parse({input, input}));
    EXPECT_FALSE(parse({(dir.path() / "missing.png").string()}));
    EXPECT_FALSE(parse({"-c", "0", input}));
    EXPECT_FALSE(parse({"-c", "many", input}));
    EXPECT_FALSE(parse({"-p", "", input}));
    EXPECT_FALSE(parse({"-b", "256", input}));
    EXPECT_FALSE(parse({"-b", "-1", input}));
}

#ifdef HAS_UNISTD
TEST_F(Parse_args, DefaultWidthNarrowsToColumns)
{
    setenv("COLUMNS", "40", 1);

    auto args = parse({input});
    ASSERT_TRUE(args);
    EXPECT_EQ(args->cols, 40);
}

TEST_F(Parse_args, ExplicitWidthIgnoresColumns)
{
    setenv("COLUMNS", "40", 1);

    auto args = parse({"-c", "200", input});
    ASSERT_TRUE(args);
    EXPECT_EQ(args->cols, 200);
}

TEST_F(Parse_args, FileOutputIgnoresColumns)
{
    setenv("COLUMNS", "40", 1);

    auto args = parse({"-o", (dir.path() / "out.txt").string(), input});
    ASSERT_TRUE(args);
    EXPECT_EQ(args->cols, default_cols);
}

TEST_F(Parse_args, NonPositiveColumnsIsIgnored)
{
    for(auto columns: {"0", "-20", "wide"})
    {
        setenv("COLUMNS", columns, 1);

        // falls back to the terminal size, if stdout is a terminal
        auto args = parse({input});
        ASSERT_TRUE(args) << "COLUMNS=" << columns;
        EXPECT_GT(args->cols, 0);
        EXPECT_LE(args->cols, default_cols);
    }
}
#endif
