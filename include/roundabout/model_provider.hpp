#pragma once

#include "roundabout/types.hpp"

#include <string>
#include <vector>

namespace roundabout {

struct ModelMessage {
    std::string role;     // "system" or "user"
    std::string content;
};

struct ModelRequest {
    std::vector<ModelMessage> messages;
    int max_tokens{150};
    double temperature{0.3};
    std::string provider_hint;
    // Results observed after this instant count as a timeout
    Timestamp deadline{};
};

struct ModelResponse {
    // Free text, expected to start with "SUCCESS:" or "FAILURE:"
    std::string content;
};

// Chat-completion boundary used by Coordinator agents during EMERGE.
// Implementations report failure by throwing.
class ModelProvider {
public:
    virtual ~ModelProvider() = default;
    virtual ModelResponse chat(const ModelRequest& request) = 0;
};

} // namespace roundabout
