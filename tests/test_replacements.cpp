#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "nlohmann/json.hpp"

#include "dfixxer_errors.hpp"
#include "replacements.hpp"

using namespace dfixxer;

TEST(Replacements, SortPutsInsertionsFirst)
{
    std::vector<TextReplacement> r = {
        TextReplacement::with_text(5, 8, "b"),
        TextReplacement::with_text(0, 2, "a"),
        TextReplacement::with_text(5, 5, "ins"),
    };
    sort_replacements(r);
    EXPECT_EQ(r[0].start, 0U);
    EXPECT_EQ(r[1].start, 5U);
    EXPECT_EQ(r[1].end, 5U);
    EXPECT_EQ(r[2].end, 8U);
}

TEST(Replacements, SourceSectionsAreTheGaps)
{
    std::string original = "0123456789";
    std::vector<TextReplacement> r = {
        TextReplacement::with_text(2, 4, "x"),
        TextReplacement::with_text(6, 6, "y"),
    };
    std::vector<SourceSection> gaps = compute_source_sections(original, r);
    EXPECT_EQ(gaps, (std::vector<SourceSection>{{0, 2}, {4, 6}, {6, 10}}));
}

TEST(Replacements, NoReplacementMeansOneGap)
{
    std::string original = "abc";
    EXPECT_EQ(compute_source_sections(original, {}), (std::vector<SourceSection>{{0, 3}}));
    EXPECT_TRUE(compute_source_sections("", {}).empty());
}

TEST(Replacements, GapsAreTiledWithIdentities)
{
    std::string original = "0123456789";
    std::vector<TextReplacement> r = fill_gaps_with_identity_replacements(original, {TextReplacement::with_text(3, 5, "xy")});

    ASSERT_EQ(r.size(), 3U);
    std::size_t pos = 0;
    for(const TextReplacement& rep : r)
    {
        EXPECT_EQ(rep.start, pos);
        pos = rep.end;
    }
    EXPECT_EQ(pos, original.size());
    EXPECT_TRUE(r[0].is_unresolved());
    EXPECT_FALSE(r[1].is_unresolved());
    EXPECT_TRUE(r[2].is_unresolved());
    EXPECT_EQ(merge_replacements(original, r), "012xy56789");
}

TEST(Replacements, MergeAppliesInOrder)
{
    std::string original = "procedure Foo;";
    std::vector<TextReplacement> r = {
        TextReplacement::with_text(13, 13, "()"),
        TextReplacement::with_text(0, 9, "function"),
    };
    EXPECT_EQ(merge_replacements(original, r), "function Foo();");
}

TEST(Replacements, MergeWithoutReplacementsIsIdentity)
{
    EXPECT_EQ(merge_replacements("unit Foo;", {}), "unit Foo;");
}

TEST(Replacements, OverlapIsRejected)
{
    std::string original = "abcdef";
    std::vector<TextReplacement> r = {
        TextReplacement::with_text(0, 3, "x"),
        TextReplacement::with_text(2, 4, "y"),
    };
    EXPECT_THROW(merge_replacements(original, r), replacement_overlap_error);
    EXPECT_THROW(merge_replacements(original, {TextReplacement::with_text(4, 9, "z")}), replacement_overlap_error);
}

TEST(Replacements, ResolveIdentity)
{
    std::string original = "hello world";
    TextReplacement id = TextReplacement::identity(6, 11);
    EXPECT_EQ(id.resolve(original), "world");
    EXPECT_THROW(id.literal(), std::bad_variant_access);
}

TEST(Replacements, NoOpIsNotCreated)
{
    std::string original = "unit Foo;";
    EXPECT_FALSE(create_text_replacement_if_different(original, 0, 4, "unit").has_value());
    std::optional<TextReplacement> r = create_text_replacement_if_different(original, 0, 4, "UNIT", true);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->is_final);
    EXPECT_EQ(r->literal(), "UNIT");
}

TEST(Replacements, MergeToFile)
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "dfixxer_merge_to_file_test.pas";
    std::string original = "uses B, A;";
    merge_replacements_to_file(path, original, {TextReplacement::with_text(5, 9, "A, B")});

    std::ifstream ifs(path, std::ios::binary);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    EXPECT_EQ(buffer.str(), "uses A, B;");
    ifs.close();
    std::filesystem::remove(path);
}

TEST(Replacements, PrintSkipsIdentities)
{
    std::string original = "a\nbc";
    std::vector<TextReplacement> r = {
        TextReplacement::identity(0, 2),
        TextReplacement::with_text(2, 4, "bb"),
    };
    std::ostringstream out;
    print_replacements(out, original, r);
    EXPECT_EQ(out.str(),
              "Replacement 1:\n"
              "  Location: 2:1-2:3\n"
              "  Original:\n"
              "    - bc\n"
              "  Replacement:\n"
              "    + bb\n"
              "\n");
}

TEST(Replacements, JsonDump)
{
    nlohmann::json j = TextReplacement::with_text(1, 2, "x", true);
    EXPECT_EQ(j["start"], 1);
    EXPECT_EQ(j["end"], 2);
    EXPECT_EQ(j["text"], "x");
    EXPECT_EQ(j["final"], true);

    nlohmann::json id = TextReplacement::identity(0, 1);
    EXPECT_TRUE(id["text"].is_null());
}

TEST(Replacements, NoOpsAreRemoved)
{
    std::string original = "x := 1;\ny := 2;";
    std::vector<TextReplacement> r = {
        TextReplacement::identity(0, 7),
        TextReplacement::with_text(0, 7, "x := 1;"),
        TextReplacement::with_text(8, 15, "y := 3;"),
        TextReplacement::with_text(15, 15, ""),
        TextReplacement::with_text(15, 15, "\n"),
    };
    remove_noop_replacements(original, r);
    ASSERT_EQ(r.size(), 2U);
    EXPECT_EQ(r[0].literal(), "y := 3;");
    EXPECT_EQ(r[1].literal(), "\n");
}

TEST(DfixxerErrors, JsonDump)
{
    parse_error e("bad");
    EXPECT_STREQ(e.what(), "Parse error: bad");
    EXPECT_EQ(e.detail(), "bad");

    nlohmann::json j = e;
    EXPECT_EQ(j["message"], "Parse error: bad");
    EXPECT_EQ(j["detail"], "bad");
}
