#include "options.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <set>

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include "dfixxer_errors.hpp"
#include "toml_config.hpp"

namespace dfixxer
{
	static constexpr std::array<std::string_view, OPERATOR_CLASS_COUNT> OPERATOR_KEYS = {
		"comma", "semi_colon", "lt", "eq", "neq", "gt", "lte", "gte", "add",
		"sub", "mul", "fdiv", "assign", "assign_add", "assign_sub", "assign_mul", "assign_div", "colon"};

	std::string_view to_string(SpaceOperation op)
	{
		switch(op)
		{
			case SpaceOperation::NoChange: return "NoChange";
			case SpaceOperation::Before: return "Before";
			case SpaceOperation::After: return "After";
			default: return "BeforeAndAfter";
		}
	}

	std::string_view to_string(UsesSectionStyle style)
	{
		return style == UsesSectionStyle::CommaAtTheBeginning ? "CommaAtTheBeginning" : "CommaAtTheEnd";
	}

	std::string_view to_string(LineEnding ending)
	{
		switch(ending)
		{
			case LineEnding::Crlf: return "Crlf";
			case LineEnding::Lf: return "Lf";
			default: return "Auto";
		}
	}

	std::string_view config_key(OperatorClass op)
	{
		return OPERATOR_KEYS[static_cast<std::size_t>(op)];
	}

	TextChangeOptions::TextChangeOptions()
	{
		operators.fill(SpaceOperation::BeforeAndAfter);
		set(OperatorClass::Comma, SpaceOperation::After);
		set(OperatorClass::SemiColon, SpaceOperation::After);
		set(OperatorClass::Colon, SpaceOperation::After);
	}

	UsesSectionOptions::UsesSectionOptions() :
		module_names_to_update(default_module_names_to_update())
	{}

	std::string Options::line_ending_string() const
	{
		switch(line_ending)
		{
			case LineEnding::Crlf: return "\r\n";
			case LineEnding::Lf: return "\n";
			default:
#ifdef _WIN32
				return "\r\n";
#else
				return "\n";
#endif
		}
	}

	/**
	 * @brief Copies values of a parsed document into Options fields, warning
	 * about anything it cannot use.
	 */
	class OptionsLoader
	{
	protected:
		const toml::FlatMap& _values;
		const std::string _origin;
		std::set<std::string> _used;

		template<typename T>
		const T* _lookup(const std::string& key)
		{
			auto it = _values.find(key);
			if(it == _values.end())
				return nullptr;
			_used.insert(key);
			const T* value = std::get_if<T>(&(it->second));
			if(! value)
				spdlog::warn("{}: '{}' holds a {}, keeping the default", _origin, key, toml::type_name(it->second));
			return value;
		}

		template<typename E>
		void _enum_field(const std::string& key, E& field, std::initializer_list<E> choices)
		{
			const std::string* name = _lookup<std::string>(key);
			if(! name)
				return;
			for(E choice : choices)
			{
				if(to_string(choice) == *name)
				{
					field = choice;
					return;
				}
			}
			spdlog::warn("{}: invalid value '{}' for '{}', keeping the default", _origin, *name, key);
		}

	public:
		OptionsLoader(const toml::FlatMap& values, const std::filesystem::path& origin) :
			_values(values),
			_origin(origin.string())
		{}

		void bool_field(const std::string& key, bool& field)
		{
			if(const bool* v = _lookup<bool>(key))
				field = *v;
		}

		void string_field(const std::string& key, std::string& field)
		{
			if(const std::string* v = _lookup<std::string>(key))
				field = *v;
		}

		void strings_field(const std::string& key, std::vector<std::string>& field)
		{
			if(const std::vector<std::string>* v = _lookup<std::vector<std::string>>(key))
				field = *v;
		}

		void space_operation_field(const std::string& key, SpaceOperation& field)
		{
			_enum_field(key, field, {SpaceOperation::NoChange, SpaceOperation::Before, SpaceOperation::After, SpaceOperation::BeforeAndAfter});
		}

		void uses_style_field(const std::string& key, UsesSectionStyle& field)
		{
			_enum_field(key, field, {UsesSectionStyle::CommaAtTheBeginning, UsesSectionStyle::CommaAtTheEnd});
		}

		void line_ending_field(const std::string& key, LineEnding& field)
		{
			_enum_field(key, field, {LineEnding::Auto, LineEnding::Crlf, LineEnding::Lf});
		}

		void patterns_field(const std::string& key, std::vector<CustomConfigPattern>& field)
		{
			const toml::StringPairs* rows = nullptr;
			auto it = _values.find(key);
			// An empty array parses as a string array.
			if(it != _values.end() && std::holds_alternative<std::vector<std::string>>(it->second)
				&& std::get<std::vector<std::string>>(it->second).empty())
			{
				_used.insert(key);
				field.clear();
				return;
			}
			rows = _lookup<toml::StringPairs>(key);
			if(! rows)
				return;

			std::vector<CustomConfigPattern> result;
			for(const std::vector<std::string>& row : *rows)
			{
				if(row.size() != 2)
				{
					spdlog::warn("{}: '{}' entries must be [pattern, config path] pairs, keeping the default", _origin, key);
					return;
				}
				result.push_back(CustomConfigPattern{row[0], row[1]});
			}
			field = std::move(result);
		}

		void warn_unused() const
		{
			for(const auto& [key, value] : _values)
			{
				if(! _used.contains(key))
					spdlog::warn("{}: unknown key '{}' ignored", _origin, key);
			}
		}
	};

	Options Options::load_from_file(const std::filesystem::path& path)
	{
		std::vector<std::string> warnings;
		toml::FlatMap values = toml::parse_file(path, warnings);
		for(const std::string& w : warnings)
			spdlog::warn("{}: {}", path.string(), w);

		Options opt;
		OptionsLoader loader(values, path);

		loader.string_field("indentation", opt.indentation);
		loader.line_ending_field("line_ending", opt.line_ending);
		loader.strings_field("exclude_files", opt.exclude_files);
		loader.patterns_field("custom_config_patterns", opt.custom_config_patterns);

		loader.uses_style_field("uses_section.uses_section_style", opt.uses_section.uses_section_style);
		loader.strings_field("uses_section.override_sorting_order", opt.uses_section.override_sorting_order);
		loader.strings_field("uses_section.module_names_to_update", opt.uses_section.module_names_to_update);

		loader.bool_field("transformations.enable_uses_section", opt.transformations.enable_uses_section);
		loader.bool_field("transformations.enable_unit_program_section", opt.transformations.enable_unit_program_section);
		loader.bool_field("transformations.enable_single_keyword_sections", opt.transformations.enable_single_keyword_sections);
		loader.bool_field("transformations.enable_procedure_section", opt.transformations.enable_procedure_section);
		loader.bool_field("transformations.enable_inherited_call_expansion", opt.transformations.enable_inherited_call_expansion);
		loader.bool_field("transformations.enable_text_transformations", opt.transformations.enable_text_transformations);

		for(std::size_t i = 0; i < OPERATOR_CLASS_COUNT; i++)
			loader.space_operation_field(fmt::format("text_changes.{}", OPERATOR_KEYS[i]), opt.text_changes.operators[i]);
		loader.bool_field("text_changes.colon_numeric_exception", opt.text_changes.colon_numeric_exception);
		loader.bool_field("text_changes.trim_trailing_whitespace", opt.text_changes.trim_trailing_whitespace);

		loader.warn_unused();
		return opt;
	}

	Options Options::load_or_default(const std::filesystem::path& path)
	{
		try
		{
			return load_from_file(path);
		}
		catch(const config_error& e)
		{
			spdlog::warn("{} Using default options.", e.what());
			return Options();
		}
	}

	void Options::create_default_config(const std::filesystem::path& path)
	{
		Options().save(path);
	}

	static std::vector<toml::Entry> to_entries(const Options& opt)
	{
		toml::StringPairs patterns;
		for(const CustomConfigPattern& p : opt.custom_config_patterns)
			patterns.push_back({p.pattern, p.config_path});

		std::vector<toml::Entry> entries = {
			{"indentation", opt.indentation},
			{"line_ending", std::string(to_string(opt.line_ending))},
			{"exclude_files", opt.exclude_files},
			{"custom_config_patterns", patterns},
			{"uses_section.uses_section_style", std::string(to_string(opt.uses_section.uses_section_style))},
			{"uses_section.override_sorting_order", opt.uses_section.override_sorting_order},
			{"uses_section.module_names_to_update", opt.uses_section.module_names_to_update},
			{"transformations.enable_uses_section", opt.transformations.enable_uses_section},
			{"transformations.enable_unit_program_section", opt.transformations.enable_unit_program_section},
			{"transformations.enable_single_keyword_sections", opt.transformations.enable_single_keyword_sections},
			{"transformations.enable_procedure_section", opt.transformations.enable_procedure_section},
			{"transformations.enable_inherited_call_expansion", opt.transformations.enable_inherited_call_expansion},
			{"transformations.enable_text_transformations", opt.transformations.enable_text_transformations},
		};

		for(std::size_t i = 0; i < OPERATOR_CLASS_COUNT; i++)
			entries.push_back({fmt::format("text_changes.{}", OPERATOR_KEYS[i]), std::string(to_string(opt.text_changes.operators[i]))});
		entries.push_back({"text_changes.colon_numeric_exception", opt.text_changes.colon_numeric_exception});
		entries.push_back({"text_changes.trim_trailing_whitespace", opt.text_changes.trim_trailing_whitespace});
		return entries;
	}

	std::string Options::to_toml() const
	{
		return toml::render(to_entries(*this));
	}

	void Options::save(const std::filesystem::path& path) const
	{
		toml::write_file(path, to_entries(*this));
	}

	/**
	 * @brief fnmatch() treats an unclosed '[' as a literal, which is never what
	 * the user meant.
	 */
	static bool is_valid_pattern(std::string_view pattern)
	{
		std::size_t open = pattern.find('[');
		while(open != std::string_view::npos)
		{
			std::size_t close = pattern.find(']', open + 2);
			if(close == std::string_view::npos)
				return false;
			open = pattern.find('[', close + 1);
		}
		return ! pattern.empty();
	}

	/**
	 * @brief Path of @p file as matched against patterns: relative to
	 * @p config_dir when it lies below it, with '/' separators.
	 */
	static std::string relative_match_path(const std::filesystem::path& config_dir, const std::filesystem::path& file)
	{
		std::filesystem::path used = file;
		if(file.is_absolute() && ! config_dir.empty())
		{
			std::filesystem::path rel = file.lexically_relative(config_dir);
			if(! rel.empty() && *rel.begin() != "..")
				used = rel;
		}
		std::string result = used.generic_string();
		std::replace(result.begin(), result.end(), '\\', '/');
		return result;
	}

	static std::optional<std::size_t> match_patterns(const std::vector<std::string>& patterns, const std::string& path)
	{
		for(std::size_t i = 0; i < patterns.size(); i++)
		{
			const std::string& pattern = patterns[i];
			if(! is_valid_pattern(pattern))
			{
				spdlog::warn("Invalid file pattern '{}' ignored", pattern);
				continue;
			}
			int rc = fnmatch(pattern.c_str(), path.c_str(), 0);
			if(rc == 0)
			{
				spdlog::debug("File '{}' matched pattern '{}'", path, pattern);
				return i;
			}
			if(rc != FNM_NOMATCH)
				spdlog::warn("Invalid file pattern '{}' ignored", pattern);
		}
		return std::nullopt;
	}

	bool Options::is_file_excluded(const std::filesystem::path& config_dir, const std::filesystem::path& file) const
	{
		if(exclude_files.empty())
			return false;
		std::string path = relative_match_path(config_dir, file);
		std::optional<std::size_t> idx = match_patterns(exclude_files, path);
		if(idx)
			spdlog::info("File '{}' excluded by pattern '{}'", file.string(), exclude_files[*idx]);
		return idx.has_value();
	}

	std::optional<std::filesystem::path> Options::custom_config_for(const std::filesystem::path& config_dir, const std::filesystem::path& file) const
	{
		if(custom_config_patterns.empty())
			return std::nullopt;

		std::vector<std::string> patterns;
		for(const CustomConfigPattern& p : custom_config_patterns)
			patterns.push_back(p.pattern);

		std::optional<std::size_t> idx = match_patterns(patterns, relative_match_path(config_dir, file));
		if(! idx)
			return std::nullopt;

		const CustomConfigPattern& match = custom_config_patterns[*idx];
		std::filesystem::path resolved = match.config_path;
		if(resolved.is_relative() && ! config_dir.empty())
			resolved = config_dir / resolved;
		spdlog::info("File '{}' matched custom config pattern '{}', using config '{}'", file.string(), match.pattern, resolved.string());
		return resolved;
	}

	std::optional<std::filesystem::path> find_config_for_filename(const std::filesystem::path& file, std::string_view config_name)
	{
		std::error_code ec;
		std::filesystem::path dir = file.parent_path();
		if(dir.empty())
			dir = std::filesystem::current_path(ec);
		if(ec)
			dir = ".";

		while(true)
		{
			std::filesystem::path candidate = dir / config_name;
			if(std::filesystem::is_regular_file(candidate, ec))
				return candidate;

			std::filesystem::path parent = dir.parent_path();
			if(parent.empty() || parent == dir)
				break;
			dir = parent;
		}
		return std::nullopt;
	}

	void to_json(nlohmann::json& j, const TextChangeOptions& o)
	{
		j = nlohmann::json::object();
		for(std::size_t i = 0; i < OPERATOR_CLASS_COUNT; i++)
			j[std::string(OPERATOR_KEYS[i])] = o.operators[i];
		j["colon_numeric_exception"] = o.colon_numeric_exception;
		j["trim_trailing_whitespace"] = o.trim_trailing_whitespace;
	}

	void to_json(nlohmann::json& j, const UsesSectionOptions& o)
	{
		j = nlohmann::json{
			{"uses_section_style", o.uses_section_style},
			{"override_sorting_order", o.override_sorting_order},
			{"module_names_to_update", o.module_names_to_update}};
	}

	void to_json(nlohmann::json& j, const TransformationOptions& o)
	{
		j = nlohmann::json{
			{"enable_uses_section", o.enable_uses_section},
			{"enable_unit_program_section", o.enable_unit_program_section},
			{"enable_single_keyword_sections", o.enable_single_keyword_sections},
			{"enable_procedure_section", o.enable_procedure_section},
			{"enable_inherited_call_expansion", o.enable_inherited_call_expansion},
			{"enable_text_transformations", o.enable_text_transformations}};
	}

	void to_json(nlohmann::json& j, const CustomConfigPattern& o)
	{
		j = nlohmann::json::array({o.pattern, o.config_path});
	}

	void to_json(nlohmann::json& j, const Options& o)
	{
		j = nlohmann::json{
			{"indentation", o.indentation},
			{"line_ending", o.line_ending},
			{"exclude_files", o.exclude_files},
			{"custom_config_patterns", o.custom_config_patterns},
			{"uses_section", o.uses_section},
			{"transformations", o.transformations},
			{"text_changes", o.text_changes}};
	}
}
