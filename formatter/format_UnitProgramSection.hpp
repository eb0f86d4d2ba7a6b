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
     * @brief Normalizes a "unit Name;" or "program Name;" header to a single
     * lowercase line. Headers holding anything else (comments, a program
     * parameter list...) are left alone.
     */
    class UnitProgramSectionFormatter
    {
    protected:
        const IndentManager* _idt;

    public:
        explicit UnitProgramSectionFormatter(const IndentManager* idt);

        std::optional<TextReplacement> format(const CodeSection& section, std::string_view source) const;
    };

    std::optional<TextReplacement> transform_unit_program_section(const CodeSection& section, const Options& options, std::string_view source);
}
