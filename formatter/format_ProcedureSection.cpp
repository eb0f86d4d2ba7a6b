#include "format_ProcedureSection.hpp"

namespace dfixxer
{
	std::optional<TextReplacement> transform_procedure_section(const CodeSection& section, const Options&, std::string_view)
	{
		if(section.keyword.kind != SectionKind::ProcedureDeclaration && section.keyword.kind != SectionKind::FunctionDeclaration)
			return std::nullopt;

		for(const ParsedNode& sibling : section.siblings)
		{
			if(sibling.kind == SectionKind::Identifier)
				return TextReplacement::with_text(sibling.span.end_byte, sibling.span.end_byte, "()");
		}
		return std::nullopt;
	}
}
