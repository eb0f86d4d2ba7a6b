#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

#define DFIXXER_CONFIG_FILENAME "dfixxer.toml"

namespace dfixxer
{
    enum class SpaceOperation
    {
        NoChange,
        Before,
        After,
        BeforeAndAfter
    };

    enum class UsesSectionStyle
    {
        CommaAtTheBeginning,
        CommaAtTheEnd
    };

    enum class LineEnding
    {
        Auto,
        Crlf,
        Lf
    };

    /**
     * @brief Operators handled by the spacing pass. The value is the index in
     * TextChangeOptions::operators.
     */
    enum class OperatorClass : std::size_t
    {
        Comma,
        SemiColon,
        Lt,
        Eq,
        Neq,
        Gt,
        Lte,
        Gte,
        Add,
        Sub,
        Mul,
        FDiv,
        Assign,
        AssignAdd,
        AssignSub,
        AssignMul,
        AssignDiv,
        Colon
    };

    constexpr std::size_t OPERATOR_CLASS_COUNT = 18;

    NLOHMANN_JSON_SERIALIZE_ENUM(SpaceOperation, {
        {SpaceOperation::NoChange, "NoChange"},
        {SpaceOperation::Before, "Before"},
        {SpaceOperation::After, "After"},
        {SpaceOperation::BeforeAndAfter, "BeforeAndAfter"},
    })

    NLOHMANN_JSON_SERIALIZE_ENUM(UsesSectionStyle, {
        {UsesSectionStyle::CommaAtTheBeginning, "CommaAtTheBeginning"},
        {UsesSectionStyle::CommaAtTheEnd, "CommaAtTheEnd"},
    })

    NLOHMANN_JSON_SERIALIZE_ENUM(LineEnding, {
        {LineEnding::Auto, "Auto"},
        {LineEnding::Crlf, "Crlf"},
        {LineEnding::Lf, "Lf"},
    })

    std::string_view to_string(SpaceOperation op);
    std::string_view to_string(UsesSectionStyle style);
    std::string_view to_string(LineEnding ending);

    /**
     * @brief Configuration key of an operator class in the [text_changes] table.
     */
    std::string_view config_key(OperatorClass op);

    struct TextChangeOptions
    {
        std::array<SpaceOperation, OPERATOR_CLASS_COUNT> operators;
        bool colon_numeric_exception = true;
        bool trim_trailing_whitespace = true;

        TextChangeOptions();

        inline SpaceOperation get(OperatorClass op) const { return operators[static_cast<std::size_t>(op)]; };
        inline void set(OperatorClass op, SpaceOperation value) { operators[static_cast<std::size_t>(op)] = value; };
    };

    struct UsesSectionOptions
    {
        UsesSectionStyle uses_section_style = UsesSectionStyle::CommaAtTheEnd;
        std::vector<std::string> override_sorting_order;
        std::vector<std::string> module_names_to_update;

        UsesSectionOptions();
    };

    struct TransformationOptions
    {
        bool enable_uses_section = true;
        bool enable_unit_program_section = true;
        bool enable_single_keyword_sections = true;
        bool enable_procedure_section = true;
        bool enable_inherited_call_expansion = true;
        bool enable_text_transformations = true;
    };

    struct CustomConfigPattern
    {
        std::string pattern;
        std::string config_path;
    };

    /**
     * @brief Formatter settings, as stored in dfixxer.toml.
     */
    struct Options
    {
        std::string indentation = "  ";
        LineEnding line_ending = LineEnding::Auto;
        UsesSectionOptions uses_section;
        TransformationOptions transformations;
        TextChangeOptions text_changes;
        std::vector<std::string> exclude_files;
        std::vector<CustomConfigPattern> custom_config_patterns;

        /**
         * @brief Line terminator to emit, with Auto resolved for the host platform.
         */
        std::string line_ending_string() const;

        /**
         * @brief Load a configuration file.
         *
         * A missing file gives the defaults. Broken lines, unknown keys and values
         * of the wrong type are reported as warnings and leave the default.
         * Throws config_error when the file exists but cannot be read.
         */
        static Options load_from_file(const std::filesystem::path& path);

        /**
         * @brief Same as load_from_file(), but any failure gives the defaults.
         */
        static Options load_or_default(const std::filesystem::path& path);

        /**
         * @brief Write a configuration file holding every key with its default value.
         */
        static void create_default_config(const std::filesystem::path& path);

        void save(const std::filesystem::path& path) const;
        std::string to_toml() const;

        /**
         * @brief Check a file against exclude_files.
         * @param config_dir Directory of the configuration file patterns are relative to
         * @param file File to check
         */
        bool is_file_excluded(const std::filesystem::path& config_dir, const std::filesystem::path& file) const;

        /**
         * @brief First custom_config_patterns entry matching @p file, as a path
         * resolved against @p config_dir.
         */
        std::optional<std::filesystem::path> custom_config_for(const std::filesystem::path& config_dir, const std::filesystem::path& file) const;
    };

    /**
     * @brief Look for @p config_name in the directory of @p file, then in each
     * parent directory up to the filesystem root.
     */
    std::optional<std::filesystem::path> find_config_for_filename(const std::filesystem::path& file,
                                                                  std::string_view config_name = DFIXXER_CONFIG_FILENAME);

    std::vector<std::string> default_module_names_to_update();

    void to_json(nlohmann::json& j, const TextChangeOptions& o);
    void to_json(nlohmann::json& j, const UsesSectionOptions& o);
    void to_json(nlohmann::json& j, const TransformationOptions& o);
    void to_json(nlohmann::json& j, const CustomConfigPattern& o);
    void to_json(nlohmann::json& j, const Options& o);
}
