#pragma once

#include <QString>
#include <optional>

namespace rc {

struct GenerationOptions {
    double temperature = 0.1;
    int maxTokens = 1000;
    int timeoutMs = 90000;
    bool jsonOutput = false;  // ask the model for a JSON object
};

// Black-box text completion. Implementations return nullopt on any failure
// (unreachable endpoint, timeout, malformed response) and never throw.
class GenerationService {
public:
    virtual ~GenerationService() = default;

    virtual std::optional<QString> complete(const QString& prompt,
                                            const GenerationOptions& options) = 0;

    // False while the service is known to be down (e.g. circuit open), so
    // callers can skip straight to their fallback.
    virtual bool isAvailable() const = 0;
};

} // namespace rc
