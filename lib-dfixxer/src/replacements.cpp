#include "replacements.hpp"

#include <algorithm>
#include <fstream>

#include "fmt/format.h"

#include "dfixxer_errors.hpp"

namespace dfixxer
{
	std::string_view TextReplacement::resolve(std::string_view original) const
	{
		if(is_unresolved())
			return original.substr(start, end - start);
		return literal();
	}

	TextReplacement TextReplacement::identity(std::size_t start, std::size_t end)
	{
		return TextReplacement{start, end, UnresolvedText{}, false};
	}

	TextReplacement TextReplacement::with_text(std::size_t start, std::size_t end, std::string text, bool is_final)
	{
		return TextReplacement{start, end, std::move(text), is_final};
	}

	/**
	 * @brief Order by start then end, so that a zero-width insertion at X comes
	 * before a replacement starting at X. Equal ranges keep their order.
	 */
	void sort_replacements(std::vector<TextReplacement>& replacements)
	{
		std::stable_sort(replacements.begin(), replacements.end(),
						 [](const TextReplacement& lhs, const TextReplacement& rhs) {
							 return lhs.start != rhs.start ? lhs.start < rhs.start : lhs.end < rhs.end;
						 });
	}

	std::vector<SourceSection> compute_source_sections(std::string_view original, const std::vector<TextReplacement>& replacements)
	{
		std::vector<TextReplacement> sorted = replacements;
		sort_replacements(sorted);

		std::vector<SourceSection> gaps;
		std::size_t pos = 0;
		for(const TextReplacement& r : sorted)
		{
			if(r.start > pos)
				gaps.push_back(SourceSection{pos, std::min(r.start, original.size())});
			pos = std::max(pos, r.end);
		}
		if(pos < original.size())
			gaps.push_back(SourceSection{pos, original.size()});

		return gaps;
	}

	std::vector<TextReplacement> fill_gaps_with_identity_replacements(std::string_view original, std::vector<TextReplacement> replacements)
	{
		for(const SourceSection& gap : compute_source_sections(original, replacements))
			replacements.push_back(TextReplacement::identity(gap.start, gap.end));

		sort_replacements(replacements);
		return replacements;
	}

	std::string merge_replacements(std::string_view original, std::vector<TextReplacement> replacements)
	{
		sort_replacements(replacements);

		std::string result;
		result.reserve(original.size());
		std::size_t pos = 0;
		for(const TextReplacement& r : replacements)
		{
			if(r.start < pos || r.end < r.start || r.end > original.size())
				throw replacement_overlap_error(fmt::format("[{}, {}) conflicts with text already merged up to {} ({} bytes in total)",
															r.start, r.end, pos, original.size()));

			result.append(original.substr(pos, r.start - pos));
			result.append(r.resolve(original));
			pos = r.end;
		}
		result.append(original.substr(pos));
		return result;
	}

	void merge_replacements_to_file(const std::filesystem::path& path, std::string_view original, const std::vector<TextReplacement>& replacements)
	{
		if(replacements.empty())
			return;

		std::string merged = merge_replacements(original, replacements);
		std::ofstream out(path, std::ios::binary | std::ios::trunc);
		if(! out.is_open())
			throw io_error(fmt::format("Failed to write file {}", path.string()));
		out.write(merged.data(), static_cast<std::streamsize>(merged.size()));
		if(! out.good())
			throw io_error(fmt::format("Failed to write file {}", path.string()));
	}

	void remove_noop_replacements(std::string_view original, std::vector<TextReplacement>& replacements)
	{
		std::erase_if(replacements, [original](const TextReplacement& r) {
			return r.is_unresolved() || (r.end <= original.size() && r.literal() == original.substr(r.start, r.end - r.start));
		});
	}

	std::optional<TextReplacement> create_text_replacement_if_different(std::string_view original, std::size_t start, std::size_t end,
																		 std::string text, bool is_final)
	{
		if(original.substr(start, end - start) == text)
			return std::nullopt;
		return TextReplacement::with_text(start, end, std::move(text), is_final);
	}

	// 1-based line and column of a byte offset.
	static std::pair<std::size_t, std::size_t> line_column(std::string_view source, std::size_t pos)
	{
		std::size_t line = 1;
		std::size_t column = 1;
		for(std::size_t i = 0; i < pos && i < source.size(); i++)
		{
			if(source[i] == '\n')
			{
				line++;
				column = 1;
			}
			else
				column++;
		}
		return {line, column};
	}

	static void print_lines(std::ostream& out, std::string_view text, std::string_view lead)
	{
		while(! text.empty())
		{
			std::size_t eol = text.find('\n');
			std::string_view line = text.substr(0, eol);
			if(line.ends_with('\r'))
				line.remove_suffix(1);
			out << "    " << lead << line << "\n";
			if(eol == std::string_view::npos)
				break;
			text.remove_prefix(eol + 1);
		}
	}

	void print_replacements(std::ostream& out, std::string_view original, const std::vector<TextReplacement>& replacements)
	{
		std::size_t index = 0;
		for(const TextReplacement& r : replacements)
		{
			if(r.is_unresolved())
				continue;

			auto [start_line, start_col] = line_column(original, r.start);
			auto [end_line, end_col] = line_column(original, r.end);

			out << fmt::format("Replacement {}:\n", ++index);
			out << fmt::format("  Location: {}:{}-{}:{}\n", start_line, start_col, end_line, end_col);
			out << "  Original:\n";
			print_lines(out, original.substr(r.start, r.end - r.start), "- ");
			out << "  Replacement:\n";
			print_lines(out, r.literal(), "+ ");
			out << "\n";
		}
	}

	void to_json(nlohmann::json& j, const TextReplacement& r)
	{
		j = nlohmann::json{{"start", r.start}, {"end", r.end}, {"final", r.is_final}};
		if(r.is_unresolved())
			j["text"] = nullptr;
		else
			j["text"] = r.literal();
	}
}
