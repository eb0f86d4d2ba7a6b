#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "code_section.hpp"
#include "format_InheritedCalls.hpp"
#include "format_ProcedureSection.hpp"
#include "format_SingleKeywordSection.hpp"
#include "format_UnitProgramSection.hpp"
#include "format_UsesSection.hpp"
#include "options.hpp"
#include "replacements.hpp"
#include "section_extractor.hpp"

using namespace dfixxer;

class TransformerTest : public ::testing::Test
{
protected:
    Options options;
    ParseResult parsed;

    void SetUp() override
    {
        options.line_ending = LineEnding::Lf;
    }

    const CodeSection& section(const std::string& source, SectionKind kind)
    {
        parsed = extract_sections(source);
        for(const CodeSection& s : parsed.code_sections)
        {
            if(s.keyword.kind == kind)
                return s;
        }
        throw std::runtime_error("No section of kind " + std::string(to_string(kind)));
    }

    /**
     * @brief Source after applying the single replacement produced for @p kind.
     */
    std::string apply(const std::string& source, SectionKind kind, std::optional<TextReplacement> (*transform)(const CodeSection&, const Options&, std::string_view))
    {
        std::optional<TextReplacement> r = transform(section(source, kind), options, source);
        if(! r)
            return source;
        return merge_replacements(source, {*r});
    }
};

// Uses clauses

static std::string in_program(const std::string& clause)
{
    return "program P;\n" + clause + "\nbegin\nend.";
}

TEST_F(TransformerTest, UsesSortedOnePerLine)
{
    std::string src = in_program("uses B, A, c;");
    EXPECT_EQ(apply(src, SectionKind::Uses, transform_uses_section), in_program("uses\n  A,\n  B,\n  c;"));
}

TEST_F(TransformerTest, UsesReplacementIsFinal)
{
    std::string src = in_program("uses B, A;");
    std::optional<TextReplacement> r = transform_uses_section(section(src, SectionKind::Uses), options, src);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->is_final);
    EXPECT_EQ(r->start, src.find("uses"));
    EXPECT_EQ(r->end, src.find("\nbegin"));
}

TEST_F(TransformerTest, UsesCommaAtTheBeginning)
{
    options.uses_section.uses_section_style = UsesSectionStyle::CommaAtTheBeginning;
    std::string src = in_program("uses B, A;");
    EXPECT_EQ(apply(src, SectionKind::Uses, transform_uses_section), in_program("uses\n    A\n  , B\n  ;"));
}

TEST_F(TransformerTest, UsesCustomIndentation)
{
    options.indentation = "\t";
    std::string src = in_program("uses B, A;");
    EXPECT_EQ(apply(src, SectionKind::Uses, transform_uses_section), in_program("uses\n\tA,\n\tB;"));
}

TEST_F(TransformerTest, UsesModulesAreRenamed)
{
    std::string src = in_program("uses SysUtils, Classes, Windows, MyUnit;");
    EXPECT_EQ(apply(src, SectionKind::Uses, transform_uses_section),
              in_program("uses\n  MyUnit,\n  System.Classes,\n  System.SysUtils,\n  Winapi.Windows;"));
}

TEST_F(TransformerTest, UsesOverrideSortingOrder)
{
    options.uses_section.override_sorting_order = {"System", "Vcl"};
    std::string src = in_program("uses Vcl.Forms, Foo, System.SysUtils, Bar, system.Classes;");
    EXPECT_EQ(apply(src, SectionKind::Uses, transform_uses_section),
              in_program("uses\n  system.Classes,\n  System.SysUtils,\n  Vcl.Forms,\n  Bar,\n  Foo;"));
}

TEST_F(TransformerTest, UsesRenameBeforeSortKeepsDuplicates)
{
    options.uses_section.uses_section_style = UsesSectionStyle::CommaAtTheBeginning;
    options.uses_section.override_sorting_order = {"System"};
    options.uses_section.module_names_to_update = {"System:Classes"};
    std::string src = in_program("uses Classes, System.SysUtils, System.Classes;");
    EXPECT_EQ(apply(src, SectionKind::Uses, transform_uses_section),
              in_program("uses\n    System.Classes\n  , System.Classes\n  , System.SysUtils\n  ;"));
}

TEST_F(TransformerTest, UsesWithCommentIsLeftAlone)
{
    std::string src = in_program("uses B, { keep } A;");
    EXPECT_FALSE(transform_uses_section(section(src, SectionKind::Uses), options, src).has_value());
}

TEST_F(TransformerTest, UsesWithDirectiveIsLeftAlone)
{
    std::string src = in_program("uses B, {$IFDEF X} A, {$ENDIF} C;");
    EXPECT_FALSE(transform_uses_section(section(src, SectionKind::Uses), options, src).has_value());
}

TEST_F(TransformerTest, FormattedUsesIsUnchanged)
{
    std::string src = in_program("uses\n  A,\n  B;");
    EXPECT_FALSE(transform_uses_section(section(src, SectionKind::Uses), options, src).has_value());
}

TEST_F(TransformerTest, IndentedUsesMovesToLineStart)
{
    std::string src = "unit U;\ninterface\n    uses B, A;\nimplementation\nend.";
    EXPECT_EQ(apply(src, SectionKind::Uses, transform_uses_section),
              "unit U;\ninterface\nuses\n  A,\n  B;\nimplementation\nend.");
}

TEST_F(TransformerTest, InlineUsesGoesToANewLine)
{
    std::string src = "program P; uses B, A;\nbegin\nend.";
    EXPECT_EQ(apply(src, SectionKind::Uses, transform_uses_section),
              "program P; \nuses\n  A,\n  B;\nbegin\nend.");
}

TEST(UsesSectionFormatter, SortIsStable)
{
    Options options;
    IndentManager idt(options);
    UsesSectionFormatter uses(options.uses_section, &idt);
    EXPECT_EQ(uses.sort_modules({"b", "A", "a", "B"}), (std::vector<std::string>{"A", "a", "b", "B"}));
}

TEST(UsesSectionFormatter, RenameRulesNeedAPrefixAndAName)
{
    Options options;
    options.uses_section.module_names_to_update = {"Foo:Bar", ":Baz", "Qux:", "NoColon"};
    IndentManager idt(options);
    UsesSectionFormatter uses(options.uses_section, &idt);
    EXPECT_EQ(uses.rename_modules({"Bar", "Baz", "Qux", "bar"}), (std::vector<std::string>{"Foo.Bar", "Baz", "Qux", "bar"}));
}

// Unit and program headers

TEST_F(TransformerTest, UnitHeaderIsNormalized)
{
    std::string src = "UNIT   Foo ;\ninterface\nimplementation\nend.";
    EXPECT_EQ(apply(src, SectionKind::Unit, transform_unit_program_section),
              "unit Foo;\ninterface\nimplementation\nend.");
}

TEST_F(TransformerTest, UnitHeaderAfterCodeGoesToANewLine)
{
    std::string src = "{ header } unit Foo;\ninterface\nimplementation\nend.";
    EXPECT_EQ(apply(src, SectionKind::Unit, transform_unit_program_section),
              "{ header } \nunit Foo;\ninterface\nimplementation\nend.");
}

TEST_F(TransformerTest, ProgramHeaderIsNormalized)
{
    std::string src = "Program  Demo;\nbegin\nend.";
    EXPECT_EQ(apply(src, SectionKind::Program, transform_unit_program_section), "program Demo;\nbegin\nend.");
}

TEST_F(TransformerTest, DottedUnitName)
{
    std::string src = "unit  My.Dotted.Name;\ninterface\nimplementation\nend.";
    EXPECT_EQ(apply(src, SectionKind::Unit, transform_unit_program_section),
              "unit My.Dotted.Name;\ninterface\nimplementation\nend.");
}

TEST_F(TransformerTest, HeaderWithCommentIsLeftAlone)
{
    std::string src = "unit {c} Foo;\ninterface\nimplementation\nend.";
    EXPECT_FALSE(transform_unit_program_section(section(src, SectionKind::Unit), options, src).has_value());
}

TEST_F(TransformerTest, ProgramWithParametersIsLeftAlone)
{
    std::string src = "program Demo(input, output);\nbegin\nend.";
    EXPECT_FALSE(transform_unit_program_section(section(src, SectionKind::Program), options, src).has_value());
}

TEST_F(TransformerTest, FormattedHeaderIsUnchanged)
{
    std::string src = "unit Foo;\ninterface\nimplementation\nend.";
    EXPECT_FALSE(transform_unit_program_section(section(src, SectionKind::Unit), options, src).has_value());
}

// Single keywords

TEST_F(TransformerTest, KeywordIsLowercased)
{
    std::string src = "unit U;\nINTERFACE\nImplementation\nend.";
    std::string out = apply(src, SectionKind::Interface, transform_single_keyword_section);
    EXPECT_EQ(out, "unit U;\ninterface\nImplementation\nend.");
    EXPECT_EQ(apply(out, SectionKind::Implementation, transform_single_keyword_section),
              "unit U;\ninterface\nimplementation\nend.");
}

TEST_F(TransformerTest, IndentedKeywordMovesToLineStart)
{
    std::string src = "unit U;\ninterface\n  Implementation\nend.";
    EXPECT_EQ(apply(src, SectionKind::Implementation, transform_single_keyword_section),
              "unit U;\ninterface\nimplementation\nend.");
}

TEST_F(TransformerTest, LowercaseKeywordIsUnchanged)
{
    std::string src = "unit U;\ninterface\n  implementation\nend.";
    EXPECT_FALSE(transform_single_keyword_section(section(src, SectionKind::Implementation), options, src).has_value());
}

TEST_F(TransformerTest, InitializationAndFinalization)
{
    std::string src = "unit U;\ninterface\nimplementation\nINITIALIZATION\n  x := 1;\nFinalization\n  x := 0;\nend.";
    std::string out = apply(src, SectionKind::Initialization, transform_single_keyword_section);
    out = apply(out, SectionKind::Finalization, transform_single_keyword_section);
    EXPECT_EQ(out, "unit U;\ninterface\nimplementation\ninitialization\n  x := 1;\nfinalization\n  x := 0;\nend.");
}

// Routine headers

TEST_F(TransformerTest, ProcedureGetsEmptyArguments)
{
    std::string src = "program P;\nprocedure Foo;\nbegin\nend;\nbegin\nend.";
    std::optional<TextReplacement> r = transform_procedure_section(section(src, SectionKind::ProcedureDeclaration), options, src);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->start, 24U);
    EXPECT_EQ(r->end, 24U);
    EXPECT_EQ(merge_replacements(src, {*r}), "program P;\nprocedure Foo();\nbegin\nend;\nbegin\nend.");
}

TEST_F(TransformerTest, FunctionGetsEmptyArguments)
{
    std::string src = "unit U;\ninterface\nfunction Bar: Integer;\nimplementation\nend.";
    EXPECT_EQ(apply(src, SectionKind::FunctionDeclaration, transform_procedure_section),
              "unit U;\ninterface\nfunction Bar(): Integer;\nimplementation\nend.");
}

TEST_F(TransformerTest, QualifiedMethodGetsEmptyArguments)
{
    std::string src = "unit U;\ninterface\nimplementation\nconstructor TFoo.Create;\nbegin\nend;\nend.";
    EXPECT_EQ(apply(src, SectionKind::ProcedureDeclaration, transform_procedure_section),
              "unit U;\ninterface\nimplementation\nconstructor TFoo.Create();\nbegin\nend;\nend.");
}

// Inherited calls

TEST(InheritedCalls, Suffix)
{
    EXPECT_EQ(inherited_call_suffix(InheritedExpansionCandidate{0, "Create", {"AName", "ACount"}}), " Create(AName, ACount)");
    EXPECT_EQ(inherited_call_suffix(InheritedExpansionCandidate{0, "Reset", {}}), " Reset()");
}

TEST(InheritedCalls, OneInsertionPerCandidate)
{
    std::string src = "unit U;\ninterface\nimplementation\nprocedure TChild.Update(var A, B: Integer);\nbegin\n  inherited;\nend;\nend.";
    ParseResult parsed = extract_sections(src);
    std::vector<TextReplacement> r = transform_inherited_calls(parsed.inherited);
    ASSERT_EQ(r.size(), 1U);
    EXPECT_EQ(r[0].start, r[0].end);
    EXPECT_EQ(merge_replacements(src, r),
              "unit U;\ninterface\nimplementation\nprocedure TChild.Update(var A, B: Integer);\nbegin\n  inherited Update(A, B);\nend;\nend.");
}
