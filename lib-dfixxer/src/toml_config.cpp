#include "toml_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "fmt/format.h"
#include "fmt/ranges.h"

#include "dfixxer_errors.hpp"

namespace dfixxer::toml
{
	namespace
	{
		std::string trim(std::string_view s)
		{
			auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
			while(! s.empty() && is_space(s.front()))
				s.remove_prefix(1);
			while(! s.empty() && is_space(s.back()))
				s.remove_suffix(1);
			return std::string(s);
		}

		/**
		 * @brief Tracks whether a scan position lies inside a basic ("...") or
		 * literal ('...') string.
		 */
		struct QuoteState
		{
			char quote = 0;
			bool escaped = false;

			/**
			 * @brief Feed one character.
			 * @return true if the character belongs to a string (quotes included)
			 */
			bool feed(char c)
			{
				if(quote == 0)
				{
					if(c == '"' || c == '\'')
					{
						quote = c;
						return true;
					}
					return false;
				}
				if(escaped)
					escaped = false;
				else if(quote == '"' && c == '\\')
					escaped = true;
				else if(c == quote)
					quote = 0;
				return true;
			}
		};

		std::string strip_comment(std::string_view line)
		{
			QuoteState state;
			std::string out;
			for(char c : line)
			{
				if(! state.feed(c) && c == '#')
					break;
				out.push_back(c);
			}
			return out;
		}

		/**
		 * @brief Net count of '[' minus ']' outside of strings.
		 */
		int bracket_depth(std::string_view text)
		{
			QuoteState state;
			int depth = 0;
			for(char c : text)
			{
				if(state.feed(c))
					continue;
				if(c == '[')
					depth++;
				else if(c == ']')
					depth--;
			}
			return depth;
		}

		bool parse_string_literal(std::string_view text, std::string& out, std::string& err)
		{
			if(text.size() < 2 || (text.front() != '"' && text.front() != '\'') || text.back() != text.front())
			{
				err = "invalid string literal";
				return false;
			}

			out.clear();
			if(text.front() == '\'')
			{
				out = text.substr(1, text.size() - 2);
				if(out.find('\'') != std::string::npos)
				{
					err = "invalid string literal";
					return false;
				}
				return true;
			}

			bool escaped = false;
			for(std::size_t i = 1; i + 1 < text.size(); i++)
			{
				char c = text[i];
				if(escaped)
				{
					switch(c)
					{
						case 'n': out.push_back('\n'); break;
						case 'r': out.push_back('\r'); break;
						case 't': out.push_back('\t'); break;
						case '"': out.push_back('"'); break;
						case '\\': out.push_back('\\'); break;
						default: out.push_back(c); break;
					}
					escaped = false;
					continue;
				}
				if(c == '\\')
				{
					escaped = true;
					continue;
				}
				if(c == '"')
				{
					err = "unexpected quote in string literal";
					return false;
				}
				out.push_back(c);
			}
			if(escaped)
			{
				err = "unterminated escape in string literal";
				return false;
			}
			return true;
		}

		bool parse_int_literal(std::string_view text, int64_t& out)
		{
			if(text.empty())
				return false;
			std::size_t i = 0;
			if(text[0] == '+' || text[0] == '-')
				i = 1;
			if(i >= text.size())
				return false;
			for(; i < text.size(); i++)
			{
				if(! std::isdigit(static_cast<unsigned char>(text[i])))
					return false;
			}
			try
			{
				out = std::stoll(std::string(text));
				return true;
			}
			catch(const std::out_of_range&)
			{
				return false;
			}
		}

		/**
		 * @brief Split the inside of an array on the commas that are neither in a
		 * string nor in a nested array. Empty items (trailing comma) are dropped.
		 */
		bool split_array_items(std::string_view text, std::vector<std::string>& out, std::string& err)
		{
			out.clear();
			QuoteState state;
			std::string cur;
			int depth = 0;
			for(char c : text)
			{
				if(state.feed(c))
				{
					cur.push_back(c);
					continue;
				}
				if(c == '[')
					depth++;
				else if(c == ']')
					depth--;

				if(c == ',' && depth == 0)
				{
					cur = trim(cur);
					if(! cur.empty())
						out.push_back(cur);
					cur.clear();
					continue;
				}
				cur.push_back(c);
			}
			if(state.quote != 0)
			{
				err = "unterminated string in array";
				return false;
			}
			if(depth != 0)
			{
				err = "unbalanced brackets in array";
				return false;
			}
			cur = trim(cur);
			if(! cur.empty())
				out.push_back(cur);
			return true;
		}

		bool parse_string_array(std::string_view text, std::vector<std::string>& out, std::string& err)
		{
			std::string v = trim(text);
			if(v.size() < 2 || v.front() != '[' || v.back() != ']')
			{
				err = "expected an array";
				return false;
			}
			std::vector<std::string> items;
			if(! split_array_items(std::string_view(v).substr(1, v.size() - 2), items, err))
				return false;

			out.clear();
			for(const std::string& item : items)
			{
				std::string sv;
				if(! parse_string_literal(item, sv, err))
				{
					err = "array values must be strings";
					return false;
				}
				out.push_back(std::move(sv));
			}
			return true;
		}

		bool parse_value(std::string_view text, Value& out, std::string& err)
		{
			const std::string v = trim(text);
			if(v.empty())
			{
				err = "empty value";
				return false;
			}

			if(v == "true")
			{
				out = true;
				return true;
			}
			if(v == "false")
			{
				out = false;
				return true;
			}

			int64_t iv = 0;
			if(parse_int_literal(v, iv))
			{
				out = iv;
				return true;
			}

			if(v.front() == '"' || v.front() == '\'')
			{
				std::string sv;
				if(! parse_string_literal(v, sv, err))
					return false;
				out = std::move(sv);
				return true;
			}

			if(v.front() == '[' && v.back() == ']')
			{
				std::vector<std::string> items;
				if(! split_array_items(std::string_view(v).substr(1, v.size() - 2), items, err))
					return false;

				if(! items.empty() && items.front().front() == '[')
				{
					StringPairs rows;
					for(const std::string& item : items)
					{
						std::vector<std::string> row;
						if(! parse_string_array(item, row, err))
							return false;
						rows.push_back(std::move(row));
					}
					out = std::move(rows);
					return true;
				}

				std::vector<std::string> values;
				if(! parse_string_array(v, values, err))
					return false;
				out = std::move(values);
				return true;
			}

			err = "unsupported TOML value";
			return false;
		}

		bool valid_key(std::string_view key)
		{
			if(key.empty())
				return false;
			for(char c : key)
			{
				bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
				if(! ok)
					return false;
			}
			return true;
		}

		std::string quote(std::string_view s)
		{
			std::string out = "\"";
			for(char c : s)
			{
				switch(c)
				{
					case '\n': out += "\\n"; break;
					case '\r': out += "\\r"; break;
					case '\t': out += "\\t"; break;
					case '"': out += "\\\""; break;
					case '\\': out += "\\\\"; break;
					default: out.push_back(c); break;
				}
			}
			out.push_back('"');
			return out;
		}

		std::string render_inline_array(const std::vector<std::string>& values)
		{
			std::vector<std::string> quoted;
			for(const std::string& v : values)
				quoted.push_back(quote(v));
			return fmt::format("[{}]", fmt::join(quoted, ", "));
		}

		std::string render_value(const Value& value)
		{
			if(const bool* b = std::get_if<bool>(&value))
				return *b ? "true" : "false";
			if(const int64_t* i = std::get_if<int64_t>(&value))
				return std::to_string(*i);
			if(const std::string* s = std::get_if<std::string>(&value))
				return quote(*s);

			if(const std::vector<std::string>* values = std::get_if<std::vector<std::string>>(&value))
			{
				std::string single = render_inline_array(*values);
				if(single.size() <= 80)
					return single;
				std::string out = "[\n";
				for(const std::string& v : *values)
					out += fmt::format("    {},\n", quote(v));
				out += "]";
				return out;
			}

			const StringPairs& rows = std::get<StringPairs>(value);
			if(rows.empty())
				return "[]";
			std::string out = "[\n";
			for(const std::vector<std::string>& row : rows)
				out += fmt::format("    {},\n", render_inline_array(row));
			out += "]";
			return out;
		}
	}

	std::string type_name(const Value& value)
	{
		switch(value.index())
		{
			case 0: return "boolean";
			case 1: return "integer";
			case 2: return "string";
			case 3: return "string array";
			default: return "array of string arrays";
		}
	}

	FlatMap parse(std::string_view text, std::vector<std::string>& warnings)
	{
		FlatMap out;
		std::vector<std::string> lines;
		{
			std::string line;
			std::istringstream stream{std::string(text)};
			while(std::getline(stream, line))
				lines.push_back(line);
		}

		std::string section;
		bool skip_section = false;
		for(std::size_t idx = 0; idx < lines.size(); idx++)
		{
			std::size_t line_no = idx + 1;
			std::string content = trim(strip_comment(lines[idx]));
			if(content.empty())
				continue;

			if(content.front() == '[')
			{
				std::string sec = content.back() == ']' ? trim(std::string_view(content).substr(1, content.size() - 2)) : "";
				if(! valid_key(sec))
				{
					warnings.push_back(fmt::format("line {}: invalid section header '{}', its keys are ignored", line_no, content));
					skip_section = true;
					continue;
				}
				section = sec;
				skip_section = false;
				continue;
			}

			std::size_t eq = content.find('=');
			if(eq == std::string::npos)
			{
				warnings.push_back(fmt::format("line {}: expected '='", line_no));
				continue;
			}
			std::string key = trim(std::string_view(content).substr(0, eq));
			std::string rhs = trim(std::string_view(content).substr(eq + 1));

			// Arrays may continue on the following lines until brackets balance.
			std::size_t first_line = line_no;
			if(! rhs.empty() && rhs.front() == '[')
			{
				while(bracket_depth(rhs) > 0 && idx + 1 < lines.size())
				{
					idx++;
					rhs += " " + trim(strip_comment(lines[idx]));
				}
			}

			if(skip_section)
				continue;
			if(! valid_key(key))
			{
				warnings.push_back(fmt::format("line {}: invalid key '{}'", first_line, key));
				continue;
			}

			Value parsed;
			std::string err;
			if(! parse_value(rhs, parsed, err))
			{
				warnings.push_back(fmt::format("line {}: {} for key '{}'", first_line, err, key));
				continue;
			}

			std::string fq = section.empty() ? key : section + "." + key;
			if(out.contains(fq))
				warnings.push_back(fmt::format("line {}: duplicate key '{}', overriding", first_line, fq));
			out[fq] = std::move(parsed);
		}
		return out;
	}

	FlatMap parse_file(const std::filesystem::path& path, std::vector<std::string>& warnings)
	{
		std::error_code ec;
		if(! std::filesystem::exists(path, ec))
			return {};

		std::ifstream ifs(path, std::ios::binary);
		if(! ifs || std::filesystem::is_directory(path, ec))
			throw config_error(fmt::format("Failed to read config file {}", path.string()));

		std::stringstream buffer;
		buffer << ifs.rdbuf();
		if(ifs.bad())
			throw config_error(fmt::format("Failed to read config file {}", path.string()));
		return parse(buffer.str(), warnings);
	}

	std::string render(const std::vector<Entry>& entries)
	{
		std::vector<std::string> sections;
		for(const Entry& e : entries)
		{
			std::size_t dot = e.key.rfind('.');
			if(dot == std::string::npos)
				continue;
			std::string sec = e.key.substr(0, dot);
			if(std::find(sections.begin(), sections.end(), sec) == sections.end())
				sections.push_back(sec);
		}

		std::string out;
		for(const Entry& e : entries)
		{
			if(e.key.find('.') == std::string::npos)
				out += fmt::format("{} = {}\n", e.key, render_value(e.value));
		}

		for(const std::string& sec : sections)
		{
			out += fmt::format("\n[{}]\n", sec);
			for(const Entry& e : entries)
			{
				std::size_t dot = e.key.rfind('.');
				if(dot != std::string::npos && e.key.substr(0, dot) == sec)
					out += fmt::format("{} = {}\n", e.key.substr(dot + 1), render_value(e.value));
			}
		}
		return out;
	}

	void write_file(const std::filesystem::path& path, const std::vector<Entry>& entries)
	{
		std::error_code ec;
		if(path.has_parent_path())
		{
			std::filesystem::create_directories(path.parent_path(), ec);
			if(ec)
				throw config_error(fmt::format("Failed to create directory {}: {}", path.parent_path().string(), ec.message()));
		}

		std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
		if(! ofs)
			throw config_error(fmt::format("Failed to write config file {}", path.string()));
		ofs << render(entries);
		if(! ofs.good())
			throw config_error(fmt::format("Failed to write config file {}", path.string()));
	}
}
