#include "format_UsesSection.hpp"

#include <algorithm>
#include <map>

#include "spdlog/spdlog.h"

#include "formatter_utils.hpp"

namespace dfixxer
{
	UsesSectionFormatter::UsesSectionFormatter(const UsesSectionOptions& options, const IndentManager* idt) :
		_opt(options),
		_idt(idt)
	{}

	std::vector<std::string> UsesSectionFormatter::rename_modules(std::vector<std::string> modules) const
	{
		std::map<std::string, std::string> prefixes;
		for(const std::string& rule : _opt.module_names_to_update)
		{
			std::size_t colon = rule.find(':');
			if(colon == std::string::npos || colon == 0 || colon + 1 == rule.size())
			{
				spdlog::debug("Ignoring module rename rule '{}'", rule);
				continue;
			}
			prefixes.try_emplace(rule.substr(colon + 1), rule.substr(0, colon));
		}

		for(std::string& module : modules)
		{
			auto it = prefixes.find(module);
			if(it != prefixes.end())
				module = it->second + "." + module;
		}
		return modules;
	}

	std::vector<std::string> UsesSectionFormatter::sort_modules(std::vector<std::string> modules) const
	{
		if(_opt.override_sorting_order.empty())
		{
			std::stable_sort(modules.begin(), modules.end(), iless);
			return modules;
		}

		auto prioritized = [this](const std::string& module) {
			return std::any_of(_opt.override_sorting_order.begin(), _opt.override_sorting_order.end(),
							   [&module](const std::string& ns) {
								   return module.size() > ns.size() && istarts_with(module, ns) && module[ns.size()] == '.';
							   });
		};

		auto rest = std::stable_partition(modules.begin(), modules.end(), prioritized);
		std::stable_sort(modules.begin(), rest, iless);
		std::stable_sort(rest, modules.end(), iless);
		return modules;
	}

	std::string UsesSectionFormatter::render(const std::vector<std::string>& modules) const
	{
		const std::string line = _idt->new_line(1);
		std::string out = "uses";

		if(_opt.uses_section_style == UsesSectionStyle::CommaAtTheEnd)
		{
			for(std::size_t i = 0; i < modules.size(); i++)
				out += line + modules[i] + (i + 1 < modules.size() ? "," : ";");
			return out;
		}

		for(std::size_t i = 0; i < modules.size(); i++)
			out += line + (i == 0 ? "  " : ", ") + modules[i];
		out += line + ";";
		return out;
	}

	std::optional<TextReplacement> UsesSectionFormatter::format(const CodeSection& section, std::string_view source) const
	{
		if(section.keyword.kind != SectionKind::Uses)
			return std::nullopt;

		std::vector<std::string> modules;
		const ParsedNode* terminator = nullptr;
		for(const ParsedNode& sibling : section.siblings)
		{
			switch(sibling.kind)
			{
			case SectionKind::Comment:
			case SectionKind::Preprocessor:
				spdlog::warn("Skipping uses section at bytes {}-{}: it holds comments or compiler directives",
							 section.keyword.span.start_byte, section.siblings.back().span.end_byte);
				return std::nullopt;
			case SectionKind::Module:
				modules.emplace_back(sibling.span.text(source));
				break;
			case SectionKind::Semicolon:
				terminator = &sibling;
				break;
			default:
				break;
			}
		}

		if(modules.empty() || ! terminator)
			return std::nullopt;

		std::string text = render(sort_modules(rename_modules(std::move(modules))));
		return _idt->adjust_replacement_for_line_position(source, section.keyword.span.start_byte, terminator->span.end_byte,
														  std::move(text), true);
	}

	std::optional<TextReplacement> transform_uses_section(const CodeSection& section, const Options& options, std::string_view source)
	{
		IndentManager idt(options);
		return UsesSectionFormatter(options.uses_section, &idt).format(section, source);
	}
}
