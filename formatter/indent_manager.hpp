#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "options.hpp"
#include "replacements.hpp"

namespace dfixxer
{
    /**
     * @brief Offset of the first byte of the line holding @p pos.
     */
    std::size_t find_line_start(std::string_view source, std::size_t pos);

    /**
     * @brief Places rewritten sections on their own line, using the configured
     * indentation and line ending.
     */
    class IndentManager
    {
    protected:
        std::string _indentation;
        std::string _line_ending;

    public:
        explicit IndentManager(const Options& options);

        inline const std::string& indentation() const { return _indentation; };
        inline const std::string& line_ending() const { return _line_ending; };

        /**
         * @brief Line break followed by @p level indentation units.
         */
        std::string new_line(unsigned int level = 0) const;

        /**
         * @brief Build the replacement of [start, end) by @p text, moved to the
         * beginning of its line.
         *
         * If only spaces or tabs precede @p start on its line, the replacement
         * starts at the line start and drops them. A UTF-8 byte order mark at the
         * start of the file is kept. Otherwise a line ending is prepended to the text.
         *
         * @return The replacement, or nothing if it would not change the source.
         */
        std::optional<TextReplacement> adjust_replacement_for_line_position(std::string_view source, std::size_t start, std::size_t end,
                                                                            std::string text, bool is_final = false) const;
    };
}
