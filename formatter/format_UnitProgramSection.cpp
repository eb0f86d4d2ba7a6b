#include "format_UnitProgramSection.hpp"

#include "fmt/format.h"

namespace dfixxer
{
	UnitProgramSectionFormatter::UnitProgramSectionFormatter(const IndentManager* idt) :
		_idt(idt)
	{}

	std::optional<TextReplacement> UnitProgramSectionFormatter::format(const CodeSection& section, std::string_view source) const
	{
		std::string_view keyword;
		if(section.keyword.kind == SectionKind::Unit)
			keyword = "unit";
		else if(section.keyword.kind == SectionKind::Program)
			keyword = "program";
		else
			return std::nullopt;

		if(section.siblings.size() != 2
		   || section.siblings[0].kind != SectionKind::Module
		   || section.siblings[1].kind != SectionKind::Semicolon)
			return std::nullopt;

		std::string text = fmt::format("{} {};", keyword, section.siblings[0].span.text(source));
		return _idt->adjust_replacement_for_line_position(source, section.keyword.span.start_byte, section.siblings[1].span.end_byte,
														  std::move(text));
	}

	std::optional<TextReplacement> transform_unit_program_section(const CodeSection& section, const Options& options, std::string_view source)
	{
		IndentManager idt(options);
		return UnitProgramSectionFormatter(&idt).format(section, source);
	}
}
