#include "format_InheritedCalls.hpp"

#include "fmt/format.h"
#include "fmt/ranges.h"

namespace dfixxer
{
	std::string inherited_call_suffix(const InheritedExpansionCandidate& candidate)
	{
		return fmt::format(" {}({})", candidate.routine_name, fmt::join(candidate.arg_names, ", "));
	}

	std::vector<TextReplacement> transform_inherited_calls(const InheritedExpansionContext& context)
	{
		std::vector<TextReplacement> ret;
		for(const InheritedExpansionCandidate& candidate : context.candidates)
			ret.push_back(TextReplacement::with_text(candidate.insert_at, candidate.insert_at, inherited_call_suffix(candidate)));
		return ret;
	}
}
