#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dfixxer::toml
{
    using StringPairs = std::vector<std::vector<std::string>>;
    using Value = std::variant<bool, int64_t, std::string, std::vector<std::string>, StringPairs>;

    /**
     * @brief Parsed document, keyed by "section.key" (or "key" before any section).
     */
    using FlatMap = std::map<std::string, Value>;

    /**
     * @brief One key/value line of a rendered document, in output order.
     */
    struct Entry
    {
        std::string key;
        Value value;
    };

    /**
     * @brief Parse the subset of TOML used by dfixxer.toml.
     *
     * Supported: [section] headers, booleans, integers, basic and literal strings,
     * arrays of strings and arrays of string arrays, arrays spread on several
     * lines, # comments. A line that cannot be understood is reported in
     * @p warnings and skipped.
     *
     * @param text Document text
     * @param warnings Receives one message per skipped line
     * @return FlatMap
     */
    FlatMap parse(std::string_view text, std::vector<std::string>& warnings);

    /**
     * @brief Read and parse a file. A missing file gives an empty map.
     * Throws config_error when the file exists but cannot be read.
     */
    FlatMap parse_file(const std::filesystem::path& path, std::vector<std::string>& warnings);

    /**
     * @brief Render entries as TOML. Keys holding a '.' are grouped under their
     * section header, in order of first appearance.
     */
    std::string render(const std::vector<Entry>& entries);

    /**
     * @brief Render entries and write them to @p path. Throws config_error on failure.
     */
    void write_file(const std::filesystem::path& path, const std::vector<Entry>& entries);

    std::string type_name(const Value& value);
}
