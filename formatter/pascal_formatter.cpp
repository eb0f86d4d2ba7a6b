#include "pascal_formatter.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "fmt/format.h"
#include "nlohmann/json.hpp"

#include "dfixxer_errors.hpp"
#include "format_InheritedCalls.hpp"
#include "format_ProcedureSection.hpp"
#include "format_SingleKeywordSection.hpp"
#include "format_UnitProgramSection.hpp"
#include "format_UsesSection.hpp"
#include "indent_manager.hpp"
#include "section_extractor.hpp"
#include "spacing_manager.hpp"

namespace dfixxer
{
	static double to_ms(std::chrono::nanoseconds duration)
	{
		return std::chrono::duration<double, std::milli>(duration).count();
	}

	void TimingCollector::_record(const std::string& name, std::chrono::nanoseconds duration)
	{
		spdlog::debug("{} took {:.3f} ms", name, to_ms(duration));
		_timings.emplace_back(name, duration);
	}

	void TimingCollector::log_summary() const
	{
		std::chrono::nanoseconds total{0};
		spdlog::info("Performance summary:");
		for(const auto& [name, duration] : _timings)
		{
			spdlog::info("  {}: {:.3f} ms", name, to_ms(duration));
			total += duration;
		}
		spdlog::info("  Total processing: {:.3f} ms", to_ms(total));
	}

	/**
	 * @brief Replacements computed from the recognized sections.
	 */
	static std::vector<TextReplacement> transform_sections(const ParseResult& parsed, const Options& options, std::string_view source)
	{
		const TransformationOptions& enabled = options.transformations;
		IndentManager idt(options);
		UsesSectionFormatter uses(options.uses_section, &idt);
		UnitProgramSectionFormatter header(&idt);
		SingleKeywordSectionFormatter keyword(&idt);

		std::vector<TextReplacement> ret;
		for(const CodeSection& section : parsed.code_sections)
		{
			std::optional<TextReplacement> r;
			switch(section.keyword.kind)
			{
			case SectionKind::Uses:
				if(enabled.enable_uses_section)
					r = uses.format(section, source);
				break;
			case SectionKind::Unit:
			case SectionKind::Program:
				if(enabled.enable_unit_program_section)
					r = header.format(section, source);
				break;
			case SectionKind::Interface:
			case SectionKind::Implementation:
			case SectionKind::Initialization:
			case SectionKind::Finalization:
				if(enabled.enable_single_keyword_sections)
					r = keyword.format(section, source);
				break;
			case SectionKind::ProcedureDeclaration:
			case SectionKind::FunctionDeclaration:
				if(enabled.enable_procedure_section)
					r = transform_procedure_section(section, options, source);
				break;
			default:
				break;
			}
			if(r)
				ret.push_back(std::move(*r));
		}

		if(enabled.enable_inherited_call_expansion)
		{
			std::vector<TextReplacement> calls = transform_inherited_calls(parsed.inherited);
			ret.insert(ret.end(), std::make_move_iterator(calls.begin()), std::make_move_iterator(calls.end()));
		}
		return ret;
	}

	std::vector<TextReplacement> produce_replacements(std::string_view source, const Options& options, TimingCollector* timing)
	{
		TimingCollector local;
		TimingCollector& t = timing ? *timing : local;

		ParseResult parsed = t.time_operation("Parsing", [&]() { return extract_sections(source); });
		std::vector<TextReplacement> replacements = t.time_operation("Transformation", [&]() {
			return transform_sections(parsed, options, source);
		});

		if(options.transformations.enable_text_transformations)
		{
			replacements = t.time_operation("Text transformations", [&]() {
				std::vector<TextReplacement> all = fill_gaps_with_identity_replacements(source, std::move(replacements));
				return apply_text_transformations(source, std::move(all), options.text_changes, parsed.spacing);
			});
		}

		remove_noop_replacements(source, replacements);
		sort_replacements(replacements);
		spdlog::debug("{} replacements produced", replacements.size());
		return replacements;
	}

	int check_exit_status(std::size_t replacement_count)
	{
		return static_cast<int>(std::min<std::size_t>(replacement_count, 255));
	}

	std::string read_source_file(const std::filesystem::path& path)
	{
		std::error_code ec;
		std::ifstream ifs(path, std::ios::binary);
		if(! ifs || std::filesystem::is_directory(path, ec))
			throw io_error(fmt::format("Failed to read file {}", path.string()));

		std::stringstream buffer;
		buffer << ifs.rdbuf();
		if(ifs.bad())
			throw io_error(fmt::format("Failed to read file {}", path.string()));
		return buffer.str();
	}

	std::filesystem::path resolve_config_path(const std::filesystem::path& file, const std::optional<std::filesystem::path>& config_path)
	{
		if(config_path)
			return *config_path;

		std::error_code ec;
		std::filesystem::path abs_file = std::filesystem::absolute(file, ec);
		std::optional<std::filesystem::path> found = find_config_for_filename(ec ? file : abs_file);
		if(found)
		{
			spdlog::debug("Using configuration {}", found->string());
			return *found;
		}
		return DFIXXER_CONFIG_FILENAME;
	}

	Options load_options_for_file(const std::filesystem::path& file, const std::filesystem::path& config_path)
	{
		Options options = Options::load_or_default(config_path);

		std::error_code ec;
		std::filesystem::path config_dir = std::filesystem::absolute(config_path, ec).parent_path();
		std::filesystem::path abs_file = std::filesystem::absolute(file, ec);

		if(std::optional<std::filesystem::path> custom = options.custom_config_for(config_dir, abs_file))
		{
			spdlog::info("Loading custom configuration from: {}", custom->string());
			options = Options::load_or_default(*custom);
		}

		spdlog::debug("Effective options: {}", nlohmann::json(options).dump());
		return options;
	}

	FileResult process_file(const std::filesystem::path& file, const std::optional<std::filesystem::path>& config_path, TimingCollector& timing)
	{
		Options options = load_options_for_file(file, resolve_config_path(file, config_path));

		FileResult result;
		result.source = timing.time_operation("File loading", [&]() { return read_source_file(file); });
		result.replacements = produce_replacements(result.source, options, &timing);
		return result;
	}
}
