#include "code_section.hpp"

namespace dfixxer
{
	std::string_view to_string(SectionKind kind)
	{
		switch (kind)
		{
		case SectionKind::Uses: return "Uses";
		case SectionKind::Unit: return "Unit";
		case SectionKind::Program: return "Program";
		case SectionKind::Interface: return "Interface";
		case SectionKind::Implementation: return "Implementation";
		case SectionKind::Initialization: return "Initialization";
		case SectionKind::Finalization: return "Finalization";
		case SectionKind::Module: return "Module";
		case SectionKind::Comment: return "Comment";
		case SectionKind::Preprocessor: return "Preprocessor";
		case SectionKind::Semicolon: return "Semicolon";
		case SectionKind::Identifier: return "Identifier";
		case SectionKind::ProcedureDeclaration: return "ProcedureDeclaration";
		case SectionKind::FunctionDeclaration: return "FunctionDeclaration";
		}
		return "Unknown";
	}

	void to_json(nlohmann::json& j, const Span& s)
	{
		j = nlohmann::json{
			{"start_byte", s.start_byte},
			{"end_byte", s.end_byte},
			{"start", {{"row", s.start_row}, {"column", s.start_column}}},
			{"end", {{"row", s.end_row}, {"column", s.end_column}}}};
	}

	void to_json(nlohmann::json& j, const ParsedNode& s)
	{
		j = nlohmann::json{{"kind", std::string(to_string(s.kind))}, {"span", s.span}};
	}

	void to_json(nlohmann::json& j, const CodeSection& s)
	{
		j = nlohmann::json{{"keyword", s.keyword}, {"siblings", s.siblings}};
	}

	void to_json(nlohmann::json& j, const InheritedExpansionCandidate& s)
	{
		j = nlohmann::json{
			{"insert_at", s.insert_at},
			{"routine_name", s.routine_name},
			{"arg_names", s.arg_names}};
	}

	void to_json(nlohmann::json& j, const SpacingContext& s)
	{
		j = nlohmann::json{
			{"unary_signs", s.unary_signs()},
			{"generic_brackets", s.generic_brackets()}};
	}

	void to_json(nlohmann::json& j, const ParseResult& s)
	{
		j = nlohmann::json{
			{"code_sections", s.code_sections},
			{"inherited_candidates", s.inherited.candidates},
			{"spacing", s.spacing}};
	}
}
