#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "code_section.hpp"
#include "options.hpp"
#include "spacing_manager.hpp"

using namespace dfixxer;

class SpacingManagerTest : public ::testing::Test
{
protected:
    TextChangeOptions options;

    std::string apply(std::string_view text) const
    {
        return SpacingManager(options).apply(text);
    }
};

TEST_F(SpacingManagerTest, CommasAndSemicolons)
{
    EXPECT_EQ(apply("a,b;c,d"), "a, b; c, d");
    EXPECT_EQ(apply("a,  b;   c"), "a, b; c");
}

TEST_F(SpacingManagerTest, TimeLiteralKeepsItsColons)
{
    EXPECT_EQ(apply("12:34:56"), "12:34:56");
}

TEST_F(SpacingManagerTest, NumericColonExceptionCanBeDisabled)
{
    options.colon_numeric_exception = false;
    EXPECT_EQ(apply("12:34"), "12: 34");
}

TEST_F(SpacingManagerTest, ColonGetsASpaceAfter)
{
    EXPECT_EQ(apply("x:Integer;"), "x: Integer;");
    EXPECT_EQ(apply("x : Integer;"), "x : Integer;");
}

TEST_F(SpacingManagerTest, BinaryOperators)
{
    EXPECT_EQ(apply("x:=a+b*c"), "x := a + b * c");
    EXPECT_EQ(apply("x  :=   a/b"), "x := a / b");
    EXPECT_EQ(apply("a<>b"), "a <> b");
    EXPECT_EQ(apply("a<=b"), "a <= b");
    EXPECT_EQ(apply("a>=b"), "a >= b");
    EXPECT_EQ(apply("a=b"), "a = b");
    EXPECT_EQ(apply("x+=1"), "x += 1");
    EXPECT_EQ(apply("x-=1"), "x -= 1");
    EXPECT_EQ(apply("x*=2"), "x *= 2");
    EXPECT_EQ(apply("x/=2"), "x /= 2");
}

TEST_F(SpacingManagerTest, StringsAreUntouched)
{
    EXPECT_EQ(apply("s := 'It''s';"), "s := 'It''s';");
    EXPECT_EQ(apply("s:='a,b:=c'"), "s := 'a,b:=c'");
}

TEST_F(SpacingManagerTest, CommentsAreUntouched)
{
    EXPECT_EQ(apply("x := 1; // a,b:=c"), "x := 1; // a,b:=c");
    EXPECT_EQ(apply("{a,b:=c}x:=1"), "{a,b:=c}x := 1");
    EXPECT_EQ(apply("(* a,b *)x:=1"), "(* a,b *)x := 1");
    EXPECT_EQ(apply("// a,b\nx:=1"), "// a,b\nx := 1");
}

TEST_F(SpacingManagerTest, UnterminatedStringEndsWithItsLine)
{
    EXPECT_EQ(apply("s := 'abc\nx:=1"), "s := 'abc\nx := 1");
}

TEST_F(SpacingManagerTest, SemicolonLeftAlone)
{
    options.set(OperatorClass::SemiColon, SpaceOperation::NoChange);
    EXPECT_EQ(apply("a,b;c,d"), "a, b;c, d");
}

TEST_F(SpacingManagerTest, TimeLiteralWithSpacedColons)
{
    options.set(OperatorClass::Colon, SpaceOperation::BeforeAndAfter);
    EXPECT_EQ(apply("time := 12:34:56;"), "time := 12:34:56;");
}

TEST_F(SpacingManagerTest, CommaAfterEscapedQuote)
{
    EXPECT_EQ(apply("s := 'It''s a test',x"), "s := 'It''s a test', x");
}

TEST_F(SpacingManagerTest, CommaBeforeSemicolonKeepsItsSpace)
{
    EXPECT_EQ(apply("f(a,;"), "f(a, ;");
    EXPECT_EQ(apply("a,,b"), "a,, b");
}

TEST_F(SpacingManagerTest, TrimmingReachesIntoComments)
{
    EXPECT_EQ(apply("{ a   \n  b }"), "{ a\n  b }");
}

TEST_F(SpacingManagerTest, TrailingWhitespaceIsTrimmed)
{
    EXPECT_EQ(apply("a := 1;   \nb := 2;\t "), "a := 1;\nb := 2;");
}

TEST_F(SpacingManagerTest, CrlfIsPreservedWhenTrimming)
{
    EXPECT_EQ(apply("a := 1;   \r\nb := 2;  \r\n"), "a := 1;\r\nb := 2;\r\n");
}

TEST_F(SpacingManagerTest, TrimmingCanBeDisabled)
{
    options.trim_trailing_whitespace = false;
    EXPECT_EQ(apply("a := 1   \nb"), "a := 1   \nb");
}

TEST_F(SpacingManagerTest, IndentationIsKept)
{
    EXPECT_EQ(apply("  x:=1"), "  x := 1");
    EXPECT_EQ(apply("a\n    + b"), "a\n    + b");
}

TEST_F(SpacingManagerTest, ExponentSignIsKept)
{
    EXPECT_EQ(apply("x := 1.5e-3;"), "x := 1.5e-3;");
    EXPECT_EQ(apply("x := 2E+10;"), "x := 2E+10;");
}

TEST_F(SpacingManagerTest, Policies)
{
    options.set(OperatorClass::Add, SpaceOperation::NoChange);
    options.set(OperatorClass::Assign, SpaceOperation::Before);
    options.set(OperatorClass::Comma, SpaceOperation::BeforeAndAfter);
    EXPECT_EQ(apply("x:=a+b"), "x :=a+b");
    EXPECT_EQ(apply("f(a,b)"), "f(a , b)");
}

TEST_F(SpacingManagerTest, UnarySignsFromContext)
{
    SpacingContext ctx;
    ctx.add_unary_sign(5);
    SpacingManager sm(options);
    EXPECT_EQ(sm.apply("x := -1;", 0, &ctx), "x := -1;");
    EXPECT_EQ(sm.apply("x := -1;"), "x := - 1;");
}

TEST_F(SpacingManagerTest, UnarySignAfterBracket)
{
    SpacingContext ctx;
    ctx.add_unary_sign(2);
    EXPECT_EQ(SpacingManager(options).apply("f(-1)", 0, &ctx), "f(-1)");
}

TEST_F(SpacingManagerTest, ContextPositionsAreOffset)
{
    SpacingContext ctx;
    ctx.add_unary_sign(105);
    EXPECT_EQ(SpacingManager(options).apply("x := -1;", 100, &ctx), "x := -1;");
}

TEST_F(SpacingManagerTest, SignAfterTheSameOperatorStaysApart)
{
    SpacingContext ctx;
    ctx.add_unary_sign(9);
    EXPECT_EQ(SpacingManager(options).apply("y := a - -b;", 0, &ctx), "y := a - -b;");

    SpacingContext packed;
    packed.add_unary_sign(5);
    EXPECT_EQ(SpacingManager(options).apply("y:=a--b;", 0, &packed), "y := a - -b;");
}

TEST_F(SpacingManagerTest, SliceBoundaries)
{
    options.set(OperatorClass::Colon, SpaceOperation::BeforeAndAfter);
    SpacingManager sm(options);
    EXPECT_EQ(sm.apply(": Integer;", 0, nullptr, ')', '\n'), " : Integer;");
    EXPECT_EQ(sm.apply(": Integer;", 0, nullptr, ' ', '\n'), ": Integer;");
    EXPECT_EQ(sm.apply(": Integer;", 0, nullptr, '\n', '\n'), ": Integer;");
    EXPECT_EQ(sm.apply("x;", 0, nullptr, '\0', 'y'), "x; ");
    EXPECT_EQ(sm.apply("x := 1  ", 0, nullptr, '\0', 'y'), "x := 1  ");
}

TEST_F(SpacingManagerTest, GenericBracketsFromContext)
{
    SpacingContext ctx;
    ctx.add_generic_bracket(5);
    ctx.add_generic_bracket(13);
    SpacingManager sm(options);
    EXPECT_EQ(sm.apply("TList<Integer>", 0, &ctx), "TList<Integer>");
    EXPECT_EQ(sm.apply("TList<Integer>"), "TList < Integer >");
}

TEST(SpacingManager, MatchOperator)
{
    auto lte = SpacingManager::match_operator("<=b", 0);
    ASSERT_TRUE(lte.has_value());
    EXPECT_EQ(lte->op, OperatorClass::Lte);
    EXPECT_EQ(lte->text, "<=");

    auto assign = SpacingManager::match_operator("x:=1", 1);
    ASSERT_TRUE(assign.has_value());
    EXPECT_EQ(assign->op, OperatorClass::Assign);

    auto colon = SpacingManager::match_operator("x: T", 1);
    ASSERT_TRUE(colon.has_value());
    EXPECT_EQ(colon->op, OperatorClass::Colon);

    EXPECT_FALSE(SpacingManager::match_operator("x", 0).has_value());
}

TEST(SpacingManager, ExponentSign)
{
    EXPECT_TRUE(SpacingManager::is_exponent_sign("1e-3", 2));
    EXPECT_TRUE(SpacingManager::is_exponent_sign("1.5E+2", 4));
    EXPECT_FALSE(SpacingManager::is_exponent_sign("x1e-3", 3));
    EXPECT_FALSE(SpacingManager::is_exponent_sign("$1E-3", 3));
    EXPECT_FALSE(SpacingManager::is_exponent_sign("a-b", 1));
    EXPECT_FALSE(SpacingManager::is_exponent_sign("e-1", 1));
}

TEST(ApplyTextTransformations, RewritesOnlyWhatChanges)
{
    std::string source = "x:=1;\ny := 2;\n";
    std::vector<TextReplacement> r = {
        TextReplacement::identity(0, 5),
        TextReplacement::identity(5, 14),
        TextReplacement::with_text(14, 14, "a,b", true),
        TextReplacement::with_text(14, 14, "c,d"),
    };
    TextChangeOptions options;
    std::vector<TextReplacement> out = apply_text_transformations(source, r, options, SpacingContext());

    ASSERT_EQ(out.size(), 4U);
    ASSERT_FALSE(out[0].is_unresolved());
    EXPECT_EQ(out[0].literal(), "x := 1;");
    EXPECT_TRUE(out[1].is_unresolved());
    EXPECT_EQ(out[2].literal(), "a,b");
    EXPECT_EQ(out[3].literal(), "c, d");
}

TEST(ApplyTextTransformations, SlicesSeeTheirNeighbours)
{
    TextChangeOptions options;
    options.set(OperatorClass::Colon, SpaceOperation::BeforeAndAfter);

    std::string header = "function Bar: Integer;";
    std::vector<TextReplacement> r = {
        TextReplacement::identity(0, 12),
        TextReplacement::with_text(12, 12, "()"),
        TextReplacement::identity(12, 22),
    };
    std::vector<TextReplacement> out = apply_text_transformations(header, r, options, SpacingContext());
    ASSERT_EQ(out.size(), 3U);
    EXPECT_TRUE(out[0].is_unresolved());
    ASSERT_FALSE(out[2].is_unresolved());
    EXPECT_EQ(out[2].literal(), " : Integer;");

    std::string statements = "x := 1;y";
    r = {
        TextReplacement::identity(0, 7),
        TextReplacement::with_text(7, 7, "z"),
        TextReplacement::identity(7, 8),
    };
    out = apply_text_transformations(statements, r, TextChangeOptions(), SpacingContext());
    ASSERT_FALSE(out[0].is_unresolved());
    EXPECT_EQ(out[0].literal(), "x := 1; ");
}
