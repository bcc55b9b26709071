#pragma once

#include <string>
#include <engram/core/types.h>

namespace engram::ml {

struct ReasoningPrompt {
    std::string system;
    std::string user;
};

/**
 * @brief Text-completion capability (an LLM behind some transport).
 *
 * Returns the raw completion. Callers that need structure ask for JSON in the prompt
 * and parse the text themselves.
 */
class IReasoner {
public:
    virtual ~IReasoner() = default;

    virtual Result<std::string> complete(const ReasoningPrompt& prompt) = 0;
    virtual std::string name() const = 0;
};

} // namespace engram::ml
