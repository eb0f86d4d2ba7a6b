#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace dfixxer
{
    enum class SectionKind
    {
        Uses,
        Unit,
        Program,
        Interface,
        Implementation,
        Initialization,
        Finalization,
        Module,
        Comment,
        Preprocessor,
        Semicolon,
        Identifier,
        ProcedureDeclaration,
        FunctionDeclaration
    };

    std::string_view to_string(SectionKind kind);

    /**
     * @brief Half-open byte range [start_byte, end_byte) in the original text,
     * with 0-based row/column positions of both ends.
     */
    struct Span
    {
        std::size_t start_byte;
        std::size_t end_byte;
        std::size_t start_row;
        std::size_t start_column;
        std::size_t end_row;
        std::size_t end_column;

        inline std::size_t length() const { return end_byte - start_byte; };
        inline std::string_view text(std::string_view source) const
        {
            return source.substr(start_byte, end_byte - start_byte);
        };
    };

    struct ParsedNode
    {
        SectionKind kind;
        Span span;
    };

    /**
     * @brief A recognized construct: its leading keyword and the ordered elements
     * that follow it (modules, separators, comments...).
     */
    struct CodeSection
    {
        ParsedNode keyword;
        std::vector<ParsedNode> siblings;
    };

    /**
     * @brief A bare "inherited;" statement that can be spelled out as a call to
     * the enclosing routine with its own arguments.
     */
    struct InheritedExpansionCandidate
    {
        std::size_t insert_at;
        std::string routine_name;
        std::vector<std::string> arg_names;
    };

    struct InheritedExpansionContext
    {
        std::vector<InheritedExpansionCandidate> candidates;
    };

    /**
     * @brief Token-level facts the spacing scanner cannot see on raw text:
     * which '+'/'-' are unary signs and which '<'/'>' delimit generic arguments.
     * Positions are byte offsets in the original text.
     */
    class SpacingContext
    {
    protected:
        std::set<std::size_t> _unary_signs;
        std::set<std::size_t> _generic_brackets;

    public:
        inline void add_unary_sign(std::size_t pos) { _unary_signs.insert(pos); };
        inline void add_generic_bracket(std::size_t pos) { _generic_brackets.insert(pos); };

        inline bool is_unary_sign(std::size_t pos) const { return _unary_signs.contains(pos); };
        inline bool is_generic_bracket(std::size_t pos) const { return _generic_brackets.contains(pos); };

        inline const std::set<std::size_t>& unary_signs() const { return _unary_signs; };
        inline const std::set<std::size_t>& generic_brackets() const { return _generic_brackets; };
    };

    struct ParseResult
    {
        std::vector<CodeSection> code_sections;
        InheritedExpansionContext inherited;
        SpacingContext spacing;
    };

    void to_json(nlohmann::json& j, const Span& s);
    void to_json(nlohmann::json& j, const ParsedNode& s);
    void to_json(nlohmann::json& j, const CodeSection& s);
    void to_json(nlohmann::json& j, const InheritedExpansionCandidate& s);
    void to_json(nlohmann::json& j, const SpacingContext& s);
    void to_json(nlohmann::json& j, const ParseResult& s);
}
