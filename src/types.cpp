#include "proofline/types.hpp"

namespace proofline
{

    std::string ProoflineError::describe() const
    {
        std::string out = error_code_to_string(code);
        if (!stage.empty())
            out += std::format(" [{}]", stage);
        out += std::format(": {}", what());
        if (!field.empty())
            out += std::format(" (field: {})", field);
        if (expected && actual)
            out += std::format(" expected={} actual={}", *expected, *actual);
        return out;
    }

} // namespace proofline
