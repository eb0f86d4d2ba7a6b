#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "code_section.hpp"
#include "options.hpp"
#include "replacements.hpp"

namespace dfixxer
{
    struct OperatorMatch
    {
        OperatorClass op;
        std::string_view text;
    };

    /**
     * @brief Applies operator spacing and trailing whitespace trimming to a piece
     * of Pascal text, leaving string literals and comments untouched.
     */
    class SpacingManager
    {
    protected:
        enum class ScanState
        {
            Code,
            StringLiteral,
            LineComment,
            BraceComment,
            ParenStarComment
        };

        const TextChangeOptions& _options;

        bool _is_numeric_colon(std::string_view text, std::size_t pos) const;
        void _space_before(std::string& out, std::string_view op, char preceding) const;
        std::size_t _space_after(std::string& out, std::string_view text, std::size_t pos, std::string_view op,
                                 char following, bool sign_follows) const;
        void _trim_trailing(std::string& out) const;

    public:
        explicit SpacingManager(const TextChangeOptions& options);

        /**
         * @brief Longest operator starting at @p pos, if any.
         */
        static std::optional<OperatorMatch> match_operator(std::string_view text, std::size_t pos);

        /**
         * @brief True if the '+' or '-' at @p pos is the sign of a decimal exponent (1.5e-3).
         */
        static bool is_exponent_sign(std::string_view text, std::size_t pos);

        std::string apply(std::string_view text) const;

        /**
         * @brief Apply the rules to a slice of the original text.
         *
         * @param text Slice to rewrite
         * @param base_offset Offset of the slice in the original text
         * @param context Signs and generic brackets found by the parser, may be null
         * @param preceding Character merged right before the slice, '\0' if none
         * @param following Character merged right after the slice, '\0' if none
         */
        std::string apply(std::string_view text, std::size_t base_offset, const SpacingContext* context,
                          char preceding = '\0', char following = '\0') const;
    };

    /**
     * @brief Run the spacing rules over every non-final replacement.
     *
     * Literal replacements are rewritten in place. Unresolved replacements are
     * rescanned from the original text with @p context and only become literal
     * when the result differs, otherwise they stay unresolved. Each slice is
     * scanned knowing the characters merged around it, so that the result does
     * not depend on where the slices were cut.
     */
    std::vector<TextReplacement> apply_text_transformations(std::string_view source, std::vector<TextReplacement> replacements,
                                                            const TextChangeOptions& options, const SpacingContext& context);
}
