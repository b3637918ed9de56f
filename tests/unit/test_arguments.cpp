#include <gtest/gtest.h>
#include <relay/arguments.hpp>
#include <relay/errors.hpp>
#include <sstream>

using namespace relay;

TEST(ArgumentsTest, Defaults)
{
    Request request = parse_arguments({}, nullptr);

    EXPECT_FALSE(request.model);
    EXPECT_FALSE(request.session_id);
    EXPECT_FALSE(request.resume_id);
    EXPECT_FALSE(request.system_prompt);
    EXPECT_FALSE(request.output_format);
    EXPECT_FALSE(request.user_prompt);
    EXPECT_FALSE(request.print_mode);
    EXPECT_EQ(request.timeout_seconds, 600);
}

TEST(ArgumentsTest, AllFlags)
{
    Request request = parse_arguments({"--print", "--model", "sonnet", "--session-id", "abc",
                                       "--resume", "def", "--append-system-prompt", "be brief",
                                       "--output-format", "json", "--timeout", "30", "hi there"},
                                      nullptr);

    EXPECT_TRUE(request.print_mode);
    EXPECT_EQ(request.model.value_or(""), "sonnet");
    EXPECT_EQ(request.session_id.value_or(""), "abc");
    EXPECT_EQ(request.resume_id.value_or(""), "def");
    EXPECT_EQ(request.system_prompt.value_or(""), "be brief");
    EXPECT_EQ(request.output_format.value_or(""), "json");
    EXPECT_EQ(request.timeout_seconds, 30);
    EXPECT_EQ(request.user_prompt.value_or(""), "hi there");
}

TEST(ArgumentsTest, FlagValueIsConsumedEvenIfItLooksLikeAFlag)
{
    Request request = parse_arguments({"--model", "--print", "prompt"}, nullptr);

    EXPECT_EQ(request.model.value_or(""), "--print");
    EXPECT_FALSE(request.print_mode);
    EXPECT_EQ(request.user_prompt.value_or(""), "prompt");
}

TEST(ArgumentsTest, FlagValueIsNotTakenAsPrompt)
{
    Request request = parse_arguments({"--session-id", "1234"}, nullptr);

    EXPECT_EQ(request.session_id.value_or(""), "1234");
    EXPECT_FALSE(request.user_prompt);
}

TEST(ArgumentsTest, UnknownFlagsAreSkipped)
{
    Request request =
        parse_arguments({"--verbose", "--dangerously-skip-permissions", "question"}, nullptr);

    EXPECT_EQ(request.user_prompt.value_or(""), "question");
    EXPECT_FALSE(request.print_mode);
}

TEST(ArgumentsTest, FirstPositionalWins)
{
    Request request = parse_arguments({"first", "second"}, nullptr);
    EXPECT_EQ(request.user_prompt.value_or(""), "first");
}

TEST(ArgumentsTest, SingleDashTokenIsPositional)
{
    Request request = parse_arguments({"-p"}, nullptr);
    EXPECT_EQ(request.user_prompt.value_or(""), "-p");
}

TEST(ArgumentsTest, TrailingValueFlagIsIgnored)
{
    Request request = parse_arguments({"prompt", "--model"}, nullptr);

    EXPECT_FALSE(request.model);
    EXPECT_EQ(request.user_prompt.value_or(""), "prompt");
}

TEST(ArgumentsTest, EmptyValuesAreAbsent)
{
    Request request = parse_arguments({"--model", "", "--output-format", ""}, nullptr);

    EXPECT_FALSE(request.model);
    EXPECT_FALSE(request.output_format);
}

TEST(ArgumentsTest, PromptReadFromStdin)
{
    std::istringstream input("hello");
    Request request = parse_arguments({"--print"}, &input);

    EXPECT_EQ(request.user_prompt.value_or(""), "hello");
}

TEST(ArgumentsTest, StdinPromptIsTrimmed)
{
    std::istringstream input("  \n\thello world\n\n");
    Request request = parse_arguments({}, &input);

    EXPECT_EQ(request.user_prompt.value_or(""), "hello world");
}

TEST(ArgumentsTest, PositionalPromptTakesPrecedenceOverStdin)
{
    std::istringstream input("from stdin");
    Request request = parse_arguments({"from argv"}, &input);

    EXPECT_EQ(request.user_prompt.value_or(""), "from argv");
    // stdin is left untouched
    EXPECT_EQ(input.tellg(), std::streampos(0));
}

TEST(ArgumentsTest, EmptyPositionalFallsBackToStdin)
{
    std::istringstream input("piped");
    Request request = parse_arguments({""}, &input);

    EXPECT_EQ(request.user_prompt.value_or(""), "piped");
}

TEST(ArgumentsTest, WhitespaceOnlyStdinIsNoPrompt)
{
    std::istringstream input(" \n \n");
    Request request = parse_arguments({}, &input);

    EXPECT_FALSE(request.user_prompt);
}

TEST(ArgumentsTest, TimeoutMustBeNumeric)
{
    EXPECT_THROW(parse_arguments({"--timeout", "abc"}, nullptr), ArgumentError);
    EXPECT_THROW(parse_arguments({"--timeout", "10s"}, nullptr), ArgumentError);
    EXPECT_THROW(parse_arguments({"--timeout", ""}, nullptr), ArgumentError);
    EXPECT_THROW(parse_arguments({"--timeout", "1.5"}, nullptr), ArgumentError);
}

TEST(ArgumentsTest, TimeoutAcceptsZeroAndNegative)
{
    EXPECT_EQ(parse_timeout("0"), 0);
    EXPECT_EQ(parse_timeout("-5"), -5);
    EXPECT_EQ(parse_arguments({"--timeout", "0", "hi"}, nullptr).timeout_seconds, 0);
}

TEST(ArgumentsTest, TimeoutOverflow)
{
    EXPECT_THROW(parse_timeout("99999999999999999999"), ArgumentError);
}

TEST(ArgumentsTest, TimeoutErrorCarriesArgument)
{
    try
    {
        parse_timeout("abc");
        FAIL() << "expected ArgumentError";
    }
    catch (const ArgumentError& e)
    {
        EXPECT_EQ(e.argument(), "abc");
        EXPECT_NE(std::string(e.what()).find("abc"), std::string::npos);
    }
}

TEST(ArgumentsTest, TimeoutToleratesSurroundingWhitespace)
{
    EXPECT_EQ(parse_timeout(" 42 "), 42);
    EXPECT_EQ(parse_timeout("+7"), 7);
}

TEST(ArgumentsTest, Trim)
{
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("a"), "a");
    EXPECT_EQ(trim("\r\n a b \t"), "a b");
}
