#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace dfixxer
{
    /**
     * @brief Placeholder text: the replacement stands for its own original slice
     * until a later pass resolves it.
     */
    struct UnresolvedText
    {
        bool operator==(const UnresolvedText&) const = default;
    };

    using ReplacementText = std::variant<UnresolvedText, std::string>;

    /**
     * @brief Substitution of the original bytes [start, end) by a text.
     *
     * A final replacement carries fully normalized text that later generic passes
     * must leave untouched.
     */
    struct TextReplacement
    {
        std::size_t start;
        std::size_t end;
        ReplacementText text;
        bool is_final = false;

        inline bool is_unresolved() const { return std::holds_alternative<UnresolvedText>(text); };

        /**
         * @brief Text of a literal replacement. Throws std::bad_variant_access on
         * an unresolved one.
         */
        inline const std::string& literal() const { return std::get<std::string>(text); };

        /**
         * @brief The text this replacement contributes to the merged output.
         */
        std::string_view resolve(std::string_view original) const;

        static TextReplacement identity(std::size_t start, std::size_t end);
        static TextReplacement with_text(std::size_t start, std::size_t end, std::string text, bool is_final = false);
    };

    /**
     * @brief A range of the original text covered by no replacement.
     */
    struct SourceSection
    {
        std::size_t start;
        std::size_t end;

        bool operator==(const SourceSection&) const = default;
    };

    void sort_replacements(std::vector<TextReplacement>& replacements);

    std::vector<SourceSection> compute_source_sections(std::string_view original, const std::vector<TextReplacement>& replacements);

    std::vector<TextReplacement> fill_gaps_with_identity_replacements(std::string_view original, std::vector<TextReplacement> replacements);

    std::string merge_replacements(std::string_view original, std::vector<TextReplacement> replacements);

    void merge_replacements_to_file(const std::filesystem::path& path, std::string_view original, const std::vector<TextReplacement>& replacements);

    /**
     * @brief Drop the replacements that would leave the text as it is: unresolved
     * ones and literals equal to the slice they replace.
     */
    void remove_noop_replacements(std::string_view original, std::vector<TextReplacement>& replacements);

    std::optional<TextReplacement> create_text_replacement_if_different(std::string_view original, std::size_t start, std::size_t end,
                                                                        std::string text, bool is_final = false);

    void print_replacements(std::ostream& out, std::string_view original, const std::vector<TextReplacement>& replacements);

    void to_json(nlohmann::json& j, const TextReplacement& r);
}
