#pragma once

#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

#define MAKE_BASIC_DFIXXER_EXCEPTION(typename, prefix) \
class typename : public dfixxer_base_exception{\
    public:\
    typename(const std::string msg) : dfixxer_base_exception(prefix, msg) {};\
};

namespace dfixxer {

    /**
     * @brief Base class for every error reported by dfixxer.
     *
     * what() returns the message prefixed by the error category, as shown to the user.
     */
    class dfixxer_base_exception : public std::runtime_error
    {
        protected:
        const std::string _detail;

        public:
        dfixxer_base_exception(const std::string prefix, const std::string msg) : 
            std::runtime_error(prefix + msg), _detail(msg) {};

        const std::string detail() const { return _detail; };
    };

    /**
     * @brief Bad command line usage.
     */
    MAKE_BASIC_DFIXXER_EXCEPTION(invalid_args_error, "Invalid arguments: ");

    /**
     * @brief A file could not be read or written.
     */
    MAKE_BASIC_DFIXXER_EXCEPTION(io_error, "I/O error: ");

    /**
     * @brief The source text could not be parsed at all.
     */
    MAKE_BASIC_DFIXXER_EXCEPTION(parse_error, "Parse error: ");

    /**
     * @brief The configuration file could not be read or written.
     */
    MAKE_BASIC_DFIXXER_EXCEPTION(config_error, "Configuration error: ");

    /**
     * @brief Two replacements of one merge overlap, or one lies past the end of the text.
     */
    MAKE_BASIC_DFIXXER_EXCEPTION(replacement_overlap_error, "Overlapping replacements: ");

    void to_json(nlohmann::json& j, const dfixxer_base_exception& e);
}
