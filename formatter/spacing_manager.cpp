#include "spacing_manager.hpp"

#include <cctype>

#include "formatter_utils.hpp"

namespace dfixxer
{
	static bool is_digit(char c)
	{
		return std::isdigit(static_cast<unsigned char>(c));
	}

	static bool applies_before(SpaceOperation op)
	{
		return op == SpaceOperation::Before || op == SpaceOperation::BeforeAndAfter;
	}

	static bool applies_after(SpaceOperation op)
	{
		return op == SpaceOperation::After || op == SpaceOperation::BeforeAndAfter;
	}

	SpacingManager::SpacingManager(const TextChangeOptions& options) :
		_options(options)
	{}

	std::optional<OperatorMatch> SpacingManager::match_operator(std::string_view text, std::size_t pos)
	{
		static constexpr OperatorMatch TWO_CHARS[] = {
			{OperatorClass::Assign, ":="},
			{OperatorClass::AssignAdd, "+="},
			{OperatorClass::AssignSub, "-="},
			{OperatorClass::AssignMul, "*="},
			{OperatorClass::AssignDiv, "/="},
			{OperatorClass::Lte, "<="},
			{OperatorClass::Gte, ">="},
			{OperatorClass::Neq, "<>"}};
		static constexpr OperatorMatch ONE_CHAR[] = {
			{OperatorClass::Colon, ":"},
			{OperatorClass::Add, "+"},
			{OperatorClass::Sub, "-"},
			{OperatorClass::Mul, "*"},
			{OperatorClass::FDiv, "/"},
			{OperatorClass::Lt, "<"},
			{OperatorClass::Gt, ">"},
			{OperatorClass::Eq, "="},
			{OperatorClass::Comma, ","},
			{OperatorClass::SemiColon, ";"}};

		std::string_view rest = text.substr(pos);
		for(const OperatorMatch& m : TWO_CHARS)
		{
			if(rest.starts_with(m.text))
				return m;
		}
		for(const OperatorMatch& m : ONE_CHAR)
		{
			if(rest.starts_with(m.text))
				return m;
		}
		return std::nullopt;
	}

	bool SpacingManager::is_exponent_sign(std::string_view text, std::size_t pos)
	{
		if(pos < 2 || (text[pos - 1] != 'e' && text[pos - 1] != 'E'))
			return false;

		std::size_t i = pos - 1;
		bool digit_seen = false;
		while(i > 0 && (is_digit(text[i - 1]) || text[i - 1] == '.'))
		{
			digit_seen |= is_digit(text[i - 1]);
			i--;
		}
		if(! digit_seen)
			return false;
		if(i == 0)
			return true;

		// 1e-3 is a number, x1e-3 or $1E-3 are not.
		char before = text[i - 1];
		return ! (std::isalnum(static_cast<unsigned char>(before)) || before == '_' || before == '$'
				  || before == '&' || before == '%' || before == '#');
	}

	bool SpacingManager::_is_numeric_colon(std::string_view text, std::size_t pos) const
	{
		return _options.colon_numeric_exception
			&& pos > 0 && pos + 1 < text.size()
			&& is_digit(text[pos - 1]) && is_digit(text[pos + 1]);
	}

	/**
	 * @brief Normalize the horizontal whitespace already emitted before an operator
	 * to a single space. Indentation and runs of the same operator are kept.
	 *
	 * @param preceding Last character merged before the scanned text, '\0' at the
	 * start of the file
	 */
	void SpacingManager::_space_before(std::string& out, std::string_view op, char preceding) const
	{
		std::size_t end = out.size();
		while(end > 0 && is_horizontal_space(out[end - 1]))
			end--;

		if(end == 0)
		{
			if(preceding == '\0' || is_line_break(preceding) || preceding == op.front())
				return;
			out.clear();
			if(! is_horizontal_space(preceding))
				out.push_back(' ');
			return;
		}

		if(is_line_break(out[end - 1]) || out[end - 1] == op.front())
			return;

		out.resize(end);
		out.push_back(' ');
	}

	/**
	 * @brief Consume the whitespace after an operator and emit one space instead.
	 *
	 * @param following First character merged after the scanned text, '\0' at the
	 * end of the file
	 * @param sign_follows The next token is a sign, keep it apart even if it is
	 * the same character as the operator
	 * @return Position of the next character to scan
	 */
	std::size_t SpacingManager::_space_after(std::string& out, std::string_view text, std::size_t pos, std::string_view op,
											 char following, bool sign_follows) const
	{
		std::size_t next = pos;
		while(next < text.size() && is_horizontal_space(text[next]))
			next++;

		char c = next < text.size() ? text[next] : following;
		if(c == '\0' || is_line_break(c) || is_horizontal_space(c) || (c == op.back() && ! sign_follows))
			return next;

		out.push_back(' ');
		return next;
	}

	void SpacingManager::_trim_trailing(std::string& out) const
	{
		while(! out.empty() && is_horizontal_space(out.back()))
			out.pop_back();
	}

	std::string SpacingManager::apply(std::string_view text) const
	{
		return apply(text, 0, nullptr);
	}

	std::string SpacingManager::apply(std::string_view text, std::size_t base_offset, const SpacingContext* context,
									  char preceding, char following) const
	{
		std::string out;
		out.reserve(text.size() + text.size() / 8);

		ScanState state = ScanState::Code;
		std::size_t i = 0;
		while(i < text.size())
		{
			char c = text[i];
			char next = i + 1 < text.size() ? text[i + 1] : '\0';

			if(is_line_break(c))
			{
				if(_options.trim_trailing_whitespace)
					_trim_trailing(out);
				out.push_back(c);
				i++;
				// An unterminated string ends with its line.
				if(state == ScanState::LineComment || state == ScanState::StringLiteral)
					state = ScanState::Code;
				continue;
			}

			switch(state)
			{
			case ScanState::StringLiteral:
				out.push_back(c);
				i++;
				if(c == '\'')
				{
					if(next == '\'')
					{
						out.push_back(next);
						i++;
					}
					else
						state = ScanState::Code;
				}
				continue;

			case ScanState::LineComment:
				out.push_back(c);
				i++;
				continue;

			case ScanState::BraceComment:
				out.push_back(c);
				i++;
				if(c == '}')
					state = ScanState::Code;
				continue;

			case ScanState::ParenStarComment:
				out.push_back(c);
				i++;
				if(c == '*' && next == ')')
				{
					out.push_back(next);
					i++;
					state = ScanState::Code;
				}
				continue;

			case ScanState::Code:
				break;
			}

			if(c == '\'')
			{
				state = ScanState::StringLiteral;
				out.push_back(c);
				i++;
				continue;
			}
			if(c == '{')
			{
				state = ScanState::BraceComment;
				out.push_back(c);
				i++;
				continue;
			}
			if((c == '/' && next == '/') || (c == '(' && next == '*'))
			{
				state = c == '/' ? ScanState::LineComment : ScanState::ParenStarComment;
				out.push_back(c);
				out.push_back(next);
				i += 2;
				continue;
			}

			std::optional<OperatorMatch> match = match_operator(text, i);
			if(! match)
			{
				out.push_back(c);
				i++;
				continue;
			}

			OperatorClass op = match->op;
			SpaceOperation policy = _options.get(op);
			bool sign = op == OperatorClass::Add || op == OperatorClass::Sub;
			bool untouched = policy == SpaceOperation::NoChange
				|| (op == OperatorClass::Colon && _is_numeric_colon(text, i))
				|| (sign && is_exponent_sign(text, i))
				|| (context && (op == OperatorClass::Lt || op == OperatorClass::Gt)
					&& context->is_generic_bracket(base_offset + i));

			if(untouched)
			{
				out += match->text;
				i += match->text.size();
				continue;
			}

			bool unary = context && sign && context->is_unary_sign(base_offset + i);
			if(applies_before(policy))
			{
				// A sign right after an opening bracket stays attached to it.
				std::size_t prev = out.find_last_not_of(" \t");
				char before = prev != std::string::npos ? out[prev] : preceding;
				bool after_bracket = before == '(' || before == '[';
				if(! (unary && after_bracket))
					_space_before(out, match->text, preceding);
			}

			out += match->text;
			i += match->text.size();

			if(applies_after(policy) && ! unary)
			{
				std::size_t next = i;
				while(next < text.size() && is_horizontal_space(text[next]))
					next++;
				bool sign_follows = context && next < text.size() && context->is_unary_sign(base_offset + next);
				i = _space_after(out, text, i, match->text, following, sign_follows);
			}
		}

		if(_options.trim_trailing_whitespace && (following == '\0' || is_line_break(following)))
			_trim_trailing(out);
		return out;
	}

	// Last character merged before replacements[index].
	static char merged_before(std::string_view source, const std::vector<TextReplacement>& replacements, std::size_t index)
	{
		for(std::size_t i = index; i > 0; i--)
		{
			std::string_view text = replacements[i - 1].resolve(source);
			if(! text.empty())
				return text.back();
		}
		return '\0';
	}

	// First character merged after replacements[index].
	static char merged_after(std::string_view source, const std::vector<TextReplacement>& replacements, std::size_t index)
	{
		for(std::size_t i = index + 1; i < replacements.size(); i++)
		{
			std::string_view text = replacements[i].resolve(source);
			if(! text.empty())
				return text.front();
		}
		return '\0';
	}

	std::vector<TextReplacement> apply_text_transformations(std::string_view source, std::vector<TextReplacement> replacements,
															const TextChangeOptions& options, const SpacingContext& context)
	{
		sort_replacements(replacements);

		SpacingManager spacing(options);
		for(std::size_t i = 0; i < replacements.size(); i++)
		{
			TextReplacement& r = replacements[i];
			if(r.is_final)
				continue;

			char preceding = merged_before(source, replacements, i);
			char following = merged_after(source, replacements, i);

			if(! r.is_unresolved())
			{
				r.text = spacing.apply(r.literal(), 0, nullptr, preceding, following);
				continue;
			}

			std::string_view original = source.substr(r.start, r.end - r.start);
			std::string modified = spacing.apply(original, r.start, &context, preceding, following);
			if(modified != original)
				r.text = std::move(modified);
		}
		return replacements;
	}
}
