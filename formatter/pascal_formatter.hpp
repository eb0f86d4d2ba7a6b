#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

#include "code_section.hpp"
#include "options.hpp"
#include "replacements.hpp"

namespace dfixxer
{
    /**
     * @brief Measures the steps of one file's processing and logs them.
     */
    class TimingCollector
    {
    protected:
        std::vector<std::pair<std::string, std::chrono::nanoseconds>> _timings;

        void _record(const std::string& name, std::chrono::nanoseconds duration);

    public:
        /**
         * @brief Run @p operation, log its duration at debug level and keep it
         * for the summary.
         */
        template<typename F>
        auto time_operation(const std::string& name, F&& operation) -> decltype(operation())
        {
            auto start = std::chrono::steady_clock::now();
            if constexpr (std::is_void_v<decltype(operation())>)
            {
                operation();
                _record(name, std::chrono::steady_clock::now() - start);
            }
            else
            {
                auto result = operation();
                _record(name, std::chrono::steady_clock::now() - start);
                return result;
            }
        };

        inline const std::vector<std::pair<std::string, std::chrono::nanoseconds>>& timings() const { return _timings; };

        void log_summary() const;
    };

    /**
     * @brief Source of a file and the replacements computed for it.
     */
    struct FileResult
    {
        std::string source;
        std::vector<TextReplacement> replacements;
    };

    /**
     * @brief Compute every replacement needed to format @p source.
     *
     * Sections are rewritten by their dedicated transformer, then the spacing
     * rules run over the rest of the text. The result is sorted and free of
     * overlaps and no-op entries. Throws parse_error when the source cannot be
     * parsed at all.
     *
     * @param source Pascal source text
     * @param options Formatting options
     * @param timing Optional collector for step durations
     * @return std::vector<TextReplacement>
     */
    std::vector<TextReplacement> produce_replacements(std::string_view source, const Options& options, TimingCollector* timing = nullptr);

    /**
     * @brief Exit status of the check command: the number of replacements,
     * capped to the largest status a process can report.
     */
    int check_exit_status(std::size_t replacement_count);

    /**
     * @brief Read a whole file. Throws io_error.
     */
    std::string read_source_file(const std::filesystem::path& path);

    /**
     * @brief Configuration file governing @p file: @p config_path if given, else
     * the closest dfixxer.toml above the file, else dfixxer.toml in the current
     * directory.
     */
    std::filesystem::path resolve_config_path(const std::filesystem::path& file, const std::optional<std::filesystem::path>& config_path);

    /**
     * @brief Options for @p file, switching to a custom configuration when one
     * of custom_config_patterns matches it.
     */
    Options load_options_for_file(const std::filesystem::path& file, const std::filesystem::path& config_path);

    FileResult process_file(const std::filesystem::path& file, const std::optional<std::filesystem::path>& config_path, TimingCollector& timing);
}
