#pragma once

#include <string>

namespace livenotes {
namespace analysis {

// Abstract interface for an external language-completion service
class CompletionService {
public:
    virtual ~CompletionService() = default;

    /**
     * Returns the model's reply text for one system + user exchange.
     * Throws on any failure.
     */
    virtual std::string complete(const std::string& system_prompt, const std::string& user_prompt) = 0;

    virtual std::string getName() const = 0;
};

} // namespace analysis
} // namespace livenotes
