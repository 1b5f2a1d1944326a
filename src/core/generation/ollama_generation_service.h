#pragma once

#include "core/generation/circuit_breaker.h"
#include "core/generation/generation_service.h"

#include <QString>

namespace rc {

// OllamaGenerationService -- GenerationService over an Ollama-compatible
// HTTP endpoint (POST <endpoint>/api/generate, non-streaming).
//
// Each call runs its own QNetworkAccessManager inside a local event loop, so
// complete() is synchronous and may be called from any thread that has no
// competing event loop of its own.
class OllamaGenerationService : public GenerationService {
public:
    OllamaGenerationService(QString endpoint, QString model);

    OllamaGenerationService(const OllamaGenerationService&) = delete;
    OllamaGenerationService& operator=(const OllamaGenerationService&) = delete;

    std::optional<QString> complete(const QString& prompt,
                                    const GenerationOptions& options) override;
    bool isAvailable() const override;

    const QString& endpoint() const { return m_endpoint; }
    const QString& model() const { return m_model; }

    // Expose for testing
    GenerationCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

    // Request body sent to /api/generate.
    QByteArray buildRequestBody(const QString& prompt, const GenerationOptions& options) const;

    // Extracts the "response" field; nullopt for anything else.
    static std::optional<QString> parseResponseBody(const QByteArray& body);

private:
    QString m_endpoint;
    QString m_model;
    GenerationCircuitBreaker m_circuitBreaker;
};

} // namespace rc
