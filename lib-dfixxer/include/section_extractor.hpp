#pragma once

#include <optional>
#include <string_view>

#include "code_section.hpp"
#include "syntax_node.hpp"

namespace dfixxer
{
    /**
     * @brief Walks a syntax tree and collects everything the formatter needs
     * from it, so that the transformers never see tree nodes.
     */
    class SectionExtractor
    {
    protected:
        std::string_view _source;
        ParseResult _result;

        void _visit(const pascal::SyntaxNode& node);
        std::optional<CodeSection> _keyword_section(const pascal::SyntaxNode& keyword, SectionKind kind) const;
        std::optional<CodeSection> _single_keyword_section(const pascal::SyntaxNode& keyword, SectionKind kind) const;
        std::optional<CodeSection> _procedure_section(const pascal::SyntaxNode& decl) const;

        void _collect_inherited(const pascal::SyntaxNode& node);
        void _collect_inherited_in_block(const pascal::SyntaxNode& node, const std::string& routine, const std::vector<std::string>& args);
        std::optional<std::size_t> _bare_inherited_insert_at(const pascal::SyntaxNode& statement) const;

        void _collect_spacing(const pascal::SyntaxNode& node);

        ParsedNode _to_parsed(const pascal::SyntaxNode& node, SectionKind kind) const;

    public:
        explicit SectionExtractor(std::string_view source);

        /**
         * @brief Run every walk over the tree of the source given at construction.
         */
        ParseResult extract(const pascal::SyntaxNode& root);
    };

    ParseResult extract_sections(const pascal::SyntaxNode& root, std::string_view source);

    /**
     * @brief Parse @p source and extract its sections.
     * Throws parse_error when nothing in the source could be recognized.
     */
    ParseResult extract_sections(std::string_view source);
}
