#include "dfixxer_errors.hpp"

namespace dfixxer
{
    void to_json(nlohmann::json& j, const dfixxer_base_exception& e)
    {
        j = nlohmann::json{{"message", e.what()}, {"detail", e.detail()}};
    }
}
