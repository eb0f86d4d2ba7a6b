#pragma once

#include <optional>
#include <string_view>

#include "code_section.hpp"
#include "options.hpp"
#include "replacements.hpp"

namespace dfixxer
{
    /**
     * @brief Adds an empty argument list to a routine header that has none:
     * "procedure Foo;" becomes "procedure Foo();".
     */
    std::optional<TextReplacement> transform_procedure_section(const CodeSection& section, const Options& options, std::string_view source);
}
