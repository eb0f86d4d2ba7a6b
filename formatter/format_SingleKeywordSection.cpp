#include "format_SingleKeywordSection.hpp"

#include "formatter_utils.hpp"

namespace dfixxer
{
	SingleKeywordSectionFormatter::SingleKeywordSectionFormatter(const IndentManager* idt) :
		_idt(idt)
	{}

	std::optional<TextReplacement> SingleKeywordSectionFormatter::format(const CodeSection& section, std::string_view source) const
	{
		switch(section.keyword.kind)
		{
		case SectionKind::Interface:
		case SectionKind::Implementation:
		case SectionKind::Initialization:
		case SectionKind::Finalization:
			break;
		default:
			return std::nullopt;
		}
		if(! section.siblings.empty())
			return std::nullopt;

		std::string_view keyword = section.keyword.span.text(source);
		std::string lowered = to_lower(keyword);
		if(lowered == keyword)
			return std::nullopt;

		return _idt->adjust_replacement_for_line_position(source, section.keyword.span.start_byte, section.keyword.span.end_byte,
														  std::move(lowered));
	}

	std::optional<TextReplacement> transform_single_keyword_section(const CodeSection& section, const Options& options, std::string_view source)
	{
		IndentManager idt(options);
		return SingleKeywordSectionFormatter(&idt).format(section, source);
	}
}
