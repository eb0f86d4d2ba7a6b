#include "indent_manager.hpp"

#include <algorithm>

#include "formatter_utils.hpp"

namespace dfixxer
{
	static constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

	std::size_t find_line_start(std::string_view source, std::size_t pos)
	{
		if(pos == 0)
			return 0;
		std::size_t nl = source.rfind('\n', pos - 1);
		return nl == std::string_view::npos ? 0 : nl + 1;
	}

	IndentManager::IndentManager(const Options& options) :
		_indentation(options.indentation),
		_line_ending(options.line_ending_string())
	{}

	std::string IndentManager::new_line(unsigned int level) const
	{
		std::string ret = _line_ending;
		for(unsigned int i = 0; i < level; i++)
			ret += _indentation;
		return ret;
	}

	std::optional<TextReplacement> IndentManager::adjust_replacement_for_line_position(std::string_view source, std::size_t start, std::size_t end,
																					   std::string text, bool is_final) const
	{
		std::size_t line_start = find_line_start(source, start);
		std::string_view prefix = source.substr(line_start, start - line_start);

		std::size_t protected_len = 0;
		if(line_start == 0 && prefix.starts_with(UTF8_BOM))
		{
			prefix.remove_prefix(UTF8_BOM.size());
			protected_len = UTF8_BOM.size();
		}

		bool blank = std::all_of(prefix.begin(), prefix.end(), is_horizontal_space);
		if(blank)
		{
			if(! prefix.empty())
				start = line_start + protected_len;
		}
		else
			text = _line_ending + text;

		return create_text_replacement_if_different(source, start, end, std::move(text), is_final);
	}
}
