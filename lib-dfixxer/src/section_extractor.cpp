#include "section_extractor.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "spdlog/spdlog.h"

#include "dfixxer_errors.hpp"
#include "pascal_syntax_tree.hpp"

namespace dfixxer
{
	using pascal::SyntaxNode;

	struct SingleKeyword
	{
		std::string_view keyword_kind;
		std::string_view section_kind;
		SectionKind kind;
	};

	static constexpr std::array<SingleKeyword, 4> SINGLE_KEYWORDS = {{
		{"kInterface", "interface", SectionKind::Interface},
		{"kImplementation", "implementation", SectionKind::Implementation},
		{"kInitialization", "initialization", SectionKind::Initialization},
		{"kFinalization", "finalization", SectionKind::Finalization},
	}};

	static constexpr std::string_view ROUTINE_KEYWORDS[] = {"kProcedure", "kFunction", "kConstructor", "kDestructor", "kOperator"};

	static constexpr std::string_view GENERIC_KINDS[] = {"genericTpl", "typerefTpl", "genericDot", "exprTpl"};

	template<std::size_t N>
	static bool is_one_of(std::string_view value, const std::string_view (&choices)[N])
	{
		return std::find(std::begin(choices), std::end(choices), value) != std::end(choices);
	}

	static const SyntaxNode* find_child(const SyntaxNode& node, std::string_view kind)
	{
		for(std::size_t i = 0; i < node.child_count(); i++)
		{
			if(node.child(i)->kind() == kind)
				return node.child(i);
		}
		return nullptr;
	}

	SectionExtractor::SectionExtractor(std::string_view source) :
		_source(source)
	{}

	ParseResult SectionExtractor::extract(const SyntaxNode& root)
	{
		_result = ParseResult();
		_visit(root);
		_collect_inherited(root);
		_collect_spacing(root);

		spdlog::debug("Extracted {} code sections, {} inherited calls, {} unary signs, {} generic brackets",
					  _result.code_sections.size(), _result.inherited.candidates.size(),
					  _result.spacing.unary_signs().size(), _result.spacing.generic_brackets().size());
		return std::move(_result);
	}

	ParsedNode SectionExtractor::_to_parsed(const SyntaxNode& node, SectionKind kind) const
	{
		pascal::SourcePoint start = node.start_point();
		pascal::SourcePoint end = node.end_point();
		return ParsedNode{kind, Span{node.start_byte(), node.end_byte(), start.row, start.column, end.row, end.column}};
	}

	void SectionExtractor::_visit(const SyntaxNode& node)
	{
		std::string_view kind = node.kind();
		std::optional<CodeSection> section;

		if(kind == "kUses")
			section = _keyword_section(node, SectionKind::Uses);
		else if(kind == "kProgram")
			section = _keyword_section(node, SectionKind::Program);
		else if(kind == "kUnit")
			section = _keyword_section(node, SectionKind::Unit);
		else if(kind == "declProc")
			section = _procedure_section(node);
		else
		{
			auto single = std::find_if(SINGLE_KEYWORDS.begin(), SINGLE_KEYWORDS.end(),
									   [kind](const SingleKeyword& k) { return k.keyword_kind == kind; });
			if(single != SINGLE_KEYWORDS.end())
				section = _single_keyword_section(node, single->kind);
			else
			{
				for(std::size_t i = 0; i < node.child_count(); i++)
					_visit(*node.child(i));
				return;
			}
		}

		if(section)
			_result.code_sections.push_back(std::move(*section));
	}

	/**
	 * @brief Build a section from a leading keyword and the nodes that follow it
	 * under the same parent.
	 */
	std::optional<CodeSection> SectionExtractor::_keyword_section(const SyntaxNode& keyword, SectionKind kind) const
	{
		if(keyword.has_error())
			return std::nullopt;

		const SyntaxNode* parent = keyword.parent();
		if(! parent)
			return std::nullopt;
		if(kind == SectionKind::Uses && (parent->kind() != "declUses" || parent->has_error()))
			return std::nullopt;

		std::size_t first = 0;
		while(first < parent->child_count() && parent->child(first) != &keyword)
			first++;

		CodeSection section{_to_parsed(keyword, kind), {}};
		bool module_found = false;
		bool terminated = false;

		for(std::size_t i = first + 1; i < parent->child_count(); i++)
		{
			const SyntaxNode* child = parent->child(i);
			if(child->has_error())
				return std::nullopt;

			std::string_view ck = child->kind();
			if(ck == ";" || ck == "kEnd")
			{
				section.siblings.push_back(_to_parsed(*child, SectionKind::Semicolon));
				terminated = true;
				if(kind != SectionKind::Uses && module_found)
					break;
			}
			else if(ck == ",")
				continue;
			else if(ck == "moduleName" || ck == "identifier")
			{
				section.siblings.push_back(_to_parsed(*child, SectionKind::Module));
				module_found = true;
			}
			else if(ck == "comment")
				section.siblings.push_back(_to_parsed(*child, SectionKind::Comment));
			else if(ck == "pp")
				section.siblings.push_back(_to_parsed(*child, SectionKind::Preprocessor));
			else if(kind == SectionKind::Uses)
			{
				section.siblings.push_back(_to_parsed(*child, SectionKind::Module));
				module_found = true;
			}
		}

		if(! terminated || ! module_found)
			return std::nullopt;
		return section;
	}

	/**
	 * @brief interface, implementation, initialization and finalization keywords
	 * that open a unit section. An interface type keyword is not one.
	 */
	std::optional<CodeSection> SectionExtractor::_single_keyword_section(const SyntaxNode& keyword, SectionKind kind) const
	{
		if(keyword.has_error() || ! keyword.parent())
			return std::nullopt;

		auto single = std::find_if(SINGLE_KEYWORDS.begin(), SINGLE_KEYWORDS.end(),
								   [kind](const SingleKeyword& k) { return k.kind == kind; });
		if(keyword.parent()->kind() != single->section_kind)
			return std::nullopt;

		return CodeSection{_to_parsed(keyword, kind), {}};
	}

	/**
	 * @brief Routine header without an argument list, e.g. "procedure Foo;".
	 */
	std::optional<CodeSection> SectionExtractor::_procedure_section(const SyntaxNode& decl) const
	{
		if(decl.has_error())
			return std::nullopt;

		const SyntaxNode* keyword = nullptr;
		const SyntaxNode* name = nullptr;
		const SyntaxNode* semicolon = nullptr;
		bool qualified = false;

		for(std::size_t i = 0; i < decl.child_count(); i++)
		{
			const SyntaxNode* child = decl.child(i);
			std::string_view ck = child->kind();

			if(ck == "declArgs")
				return std::nullopt;
			if(! keyword && is_one_of(ck, ROUTINE_KEYWORDS))
				keyword = child;
			else if(ck == "genericDot")
			{
				name = child;
				qualified = true;
			}
			else if(ck == "identifier" && ! name && ! qualified)
				name = child;
			else if(ck == ";" && ! semicolon)
				semicolon = child;
		}

		if(! keyword || ! name || ! semicolon)
			return std::nullopt;

		SectionKind kind = (keyword->kind() == "kFunction" || keyword->kind() == "kOperator")
							   ? SectionKind::FunctionDeclaration
							   : SectionKind::ProcedureDeclaration;

		return CodeSection{_to_parsed(*keyword, kind),
						   {_to_parsed(*name, SectionKind::Identifier), _to_parsed(*semicolon, SectionKind::Semicolon)}};
	}

	void SectionExtractor::_collect_inherited(const SyntaxNode& node)
	{
		if(node.kind() == "defProc" && ! node.has_error())
		{
			const SyntaxNode* decl = find_child(node, "declProc");
			const SyntaxNode* block = find_child(node, "block");
			if(decl && block && ! decl->has_error() && ! block->has_error())
			{
				// The last part of a qualified name is the routine itself.
				std::string routine;
				for(std::size_t i = 0; i < decl->child_count() && routine.empty(); i++)
				{
					const SyntaxNode* child = decl->child(i);
					if(child->kind() == "identifier")
						routine = child->text(_source);
					else if(child->kind() == "genericDot")
					{
						for(std::size_t j = 0; j < child->child_count(); j++)
						{
							if(child->child(j)->kind() == "identifier")
								routine = child->child(j)->text(_source);
						}
					}
				}

				std::vector<std::string> args;
				if(const SyntaxNode* decl_args = find_child(*decl, "declArgs"))
				{
					for(std::size_t i = 0; i < decl_args->child_count(); i++)
					{
						const SyntaxNode* arg = decl_args->child(i);
						if(arg->kind() != "declArg")
							continue;
						for(std::size_t j = 0; j < arg->child_count(); j++)
						{
							const SyntaxNode* part = arg->child(j);
							if(part->kind() == ":")
								break;
							if(part->kind() == "identifier")
								args.emplace_back(part->text(_source));
						}
					}
				}

				if(! routine.empty())
					_collect_inherited_in_block(*block, routine, args);
			}
		}

		for(std::size_t i = 0; i < node.child_count(); i++)
			_collect_inherited(*node.child(i));
	}

	void SectionExtractor::_collect_inherited_in_block(const SyntaxNode& node, const std::string& routine, const std::vector<std::string>& args)
	{
		for(std::size_t i = 0; i < node.child_count(); i++)
		{
			const SyntaxNode& child = *node.child(i);
			if(child.kind() == "defProc")
				continue;
			if(child.kind() == "statement")
			{
				if(std::optional<std::size_t> insert_at = _bare_inherited_insert_at(child))
				{
					_result.inherited.candidates.push_back(InheritedExpansionCandidate{*insert_at, routine, args});
					continue;
				}
			}
			_collect_inherited_in_block(child, routine, args);
		}
	}

	/**
	 * @brief Offset right after the keyword of an "inherited;" statement.
	 */
	std::optional<std::size_t> SectionExtractor::_bare_inherited_insert_at(const SyntaxNode& statement) const
	{
		if(statement.has_error())
			return std::nullopt;

		const SyntaxNode* inherited = nullptr;
		const SyntaxNode* semicolon = nullptr;
		for(std::size_t i = 0; i < statement.child_count(); i++)
		{
			const SyntaxNode* child = statement.child(i);
			if(child->kind() == "inherited")
			{
				if(inherited)
					return std::nullopt;
				inherited = child;
			}
			else if(child->kind() == ";" && ! semicolon)
				semicolon = child;
		}

		if(! inherited || ! semicolon || semicolon->start_byte() < inherited->end_byte())
			return std::nullopt;
		if(inherited->child_count() != 1 || inherited->child(0)->kind() != "kInherited")
			return std::nullopt;

		std::string_view between = _source.substr(inherited->end_byte(), semicolon->start_byte() - inherited->end_byte());
		if(between.find_first_not_of(" \t\r\n") != std::string_view::npos)
			return std::nullopt;
		return inherited->end_byte();
	}

	/**
	 * @brief Signs and generic angle brackets, as told by the grammar, for the
	 * spacing scanner.
	 */
	void SectionExtractor::_collect_spacing(const SyntaxNode& node)
	{
		std::string_view kind = node.kind();

		if(is_one_of(kind, GENERIC_KINDS))
		{
			std::string_view text = node.text(_source);
			for(std::size_t i = 0; i < text.size(); i++)
			{
				if(text[i] == '<' || text[i] == '>')
					_result.spacing.add_generic_bracket(node.start_byte() + i);
			}
		}
		else if(kind == "exprUnary")
		{
			for(std::size_t i = 0; i < node.child_count(); i++)
			{
				std::string_view ck = node.child(i)->kind();
				if(ck == "kAdd" || ck == "kSub")
					_result.spacing.add_unary_sign(node.child(i)->start_byte());
			}
		}
		else if(kind == "literalNumber")
		{
			std::string_view text = node.text(_source);
			if(text.starts_with('-') || text.starts_with('+'))
				_result.spacing.add_unary_sign(node.start_byte());
		}

		for(std::size_t i = 0; i < node.child_count(); i++)
			_collect_spacing(*node.child(i));
	}

	ParseResult extract_sections(const SyntaxNode& root, std::string_view source)
	{
		SectionExtractor extractor(source);
		return extractor.extract(root);
	}

	ParseResult extract_sections(std::string_view source)
	{
		std::unique_ptr<pascal::PascalSyntaxTree> tree = pascal::PascalSyntaxTree::parse(source);
		if(! tree)
			throw parse_error("Failed to parse source: the Pascal grammar could not be loaded");
		if(tree->is_unparseable())
			throw parse_error("Failed to parse source: no Pascal construct recognized");
		return extract_sections(tree->root(), source);
	}
}
