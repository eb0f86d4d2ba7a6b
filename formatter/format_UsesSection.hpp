#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "code_section.hpp"
#include "indent_manager.hpp"
#include "options.hpp"
#include "replacements.hpp"

namespace dfixxer
{
    /**
     * @brief Rewrites a uses clause with one module per line, sorted, with the
     * configured comma placement. Clauses holding comments or compiler
     * directives are left alone.
     */
    class UsesSectionFormatter
    {
    protected:
        const UsesSectionOptions& _opt;
        const IndentManager* _idt;

    public:
        UsesSectionFormatter(const UsesSectionOptions& options, const IndentManager* idt);

        /**
         * @brief Apply "Prefix:Name" rules: a module spelled exactly Name becomes Prefix.Name.
         */
        std::vector<std::string> rename_modules(std::vector<std::string> modules) const;

        /**
         * @brief Case-insensitive stable sort. Modules in one of the
         * override_sorting_order namespaces come first.
         */
        std::vector<std::string> sort_modules(std::vector<std::string> modules) const;

        std::string render(const std::vector<std::string>& modules) const;

        std::optional<TextReplacement> format(const CodeSection& section, std::string_view source) const;
    };

    std::optional<TextReplacement> transform_uses_section(const CodeSection& section, const Options& options, std::string_view source);
}
