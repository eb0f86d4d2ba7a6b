#pragma once

#include <optional>
#include <string_view>

#include "code_section.hpp"
#include "indent_manager.hpp"
#include "options.hpp"
#include "replacements.hpp"

namespace dfixxer
{
    /**
     * @brief Lowercases the interface, implementation, initialization and
     * finalization keywords and puts them on their own line.
     */
    class SingleKeywordSectionFormatter
    {
    protected:
        const IndentManager* _idt;

    public:
        explicit SingleKeywordSectionFormatter(const IndentManager* idt);

        std::optional<TextReplacement> format(const CodeSection& section, std::string_view source) const;
    };

    std::optional<TextReplacement> transform_single_keyword_section(const CodeSection& section, const Options& options, std::string_view source);
}
