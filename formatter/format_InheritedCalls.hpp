#pragma once

#include <string>
#include <vector>

#include "code_section.hpp"
#include "replacements.hpp"

namespace dfixxer
{
    /**
     * @brief Text of the call a bare "inherited;" stands for, e.g. " Create(AOwner)".
     */
    std::string inherited_call_suffix(const InheritedExpansionCandidate& candidate);

    /**
     * @brief One zero-width insertion per candidate, spelling out the routine
     * name and its arguments after the inherited keyword.
     */
    std::vector<TextReplacement> transform_inherited_calls(const InheritedExpansionContext& context);
}
