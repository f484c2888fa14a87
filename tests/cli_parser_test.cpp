#include "cli/cli_parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace stegbmp {
namespace {

// argv helper; keeps the strings alive for the parser call
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) ptrs.push_back(&s[0]);
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> storage;
    std::vector<char*> ptrs;
};

TEST(CliParserTest, SplitsPositionalsAndFlags) {
    Argv a({"stegbmp", "store", "--padded", "cover.bmp", "hello world", "--verbose"});
    CliParser cli;
    cli.parse(a.argc(), a.argv());
    ASSERT_EQ(cli.positional().size(), 3u);
    EXPECT_EQ(cli.positional()[0], "store");
    EXPECT_EQ(cli.positional()[1], "cover.bmp");
    EXPECT_EQ(cli.positional()[2], "hello world");
    EXPECT_TRUE(cli.has("padded"));
    EXPECT_TRUE(cli.has("verbose"));
    EXPECT_EQ(cli.get("padded"), "true");
}

TEST(CliParserTest, ValueKeysConsumeNextArgument) {
    Argv a({"stegbmp", "store", "--out", "x.bmp", "in.bmp", "text"});
    CliParser cli({"out"});
    cli.parse(a.argc(), a.argv());
    EXPECT_EQ(cli.get("out"), "x.bmp");
    ASSERT_EQ(cli.positional().size(), 3u);
    EXPECT_EQ(cli.positional()[1], "in.bmp");
}

TEST(CliParserTest, MissingKeyReturnsDefault) {
    Argv a({"stegbmp", "check", "a.bmp"});
    CliParser cli({"out"});
    cli.parse(a.argc(), a.argv());
    EXPECT_FALSE(cli.has("out"));
    EXPECT_EQ(cli.get("out", "fallback"), "fallback");
}

TEST(CliParserTest, ReparseClearsState) {
    CliParser cli;
    Argv first({"stegbmp", "check", "--padded", "a.bmp"});
    cli.parse(first.argc(), first.argv());
    Argv second({"stegbmp", "retrieve", "b.bmp"});
    cli.parse(second.argc(), second.argv());
    EXPECT_FALSE(cli.has("padded"));
    EXPECT_EQ(cli.positional(), (std::vector<std::string>{"retrieve", "b.bmp"}));
}

} // namespace
} // namespace stegbmp
