#include "core/generation/ollama_generation_service.h"
#include "core/shared/logging.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include <utility>

namespace rc {

OllamaGenerationService::OllamaGenerationService(QString endpoint, QString model)
    : m_endpoint(std::move(endpoint))
    , m_model(std::move(model))
{
    while (m_endpoint.endsWith(QLatin1Char('/'))) {
        m_endpoint.chop(1);
    }
}

bool OllamaGenerationService::isAvailable() const
{
    return !m_circuitBreaker.isOpen();
}

QByteArray OllamaGenerationService::buildRequestBody(const QString& prompt,
                                                     const GenerationOptions& options) const
{
    QJsonObject modelOptions;
    modelOptions[QStringLiteral("temperature")] = options.temperature;
    modelOptions[QStringLiteral("num_predict")] = options.maxTokens;

    QJsonObject request;
    request[QStringLiteral("model")] = m_model;
    request[QStringLiteral("prompt")] = prompt;
    request[QStringLiteral("stream")] = false;
    request[QStringLiteral("options")] = modelOptions;
    if (options.jsonOutput) {
        request[QStringLiteral("format")] = QStringLiteral("json");
    }
    return QJsonDocument(request).toJson(QJsonDocument::Compact);
}

std::optional<QString> OllamaGenerationService::parseResponseBody(const QByteArray& body)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    const QJsonValue response = doc.object().value(QStringLiteral("response"));
    if (!response.isString()) {
        return std::nullopt;
    }
    return response.toString();
}

std::optional<QString> OllamaGenerationService::complete(const QString& prompt,
                                                         const GenerationOptions& options)
{
    if (m_circuitBreaker.isOpen()) {
        LOG_DEBUG(rcGeneration, "Circuit open, skipping generation request");
        return std::nullopt;
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(QUrl(m_endpoint + QStringLiteral("/api/generate")));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setTransferTimeout(options.timeoutMs);

    QNetworkReply* reply = manager.post(request, buildRequestBody(prompt, options));

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    // Backstop in case the transfer timeout never fires (e.g. stalled connect)
    QTimer guard;
    guard.setSingleShot(true);
    QObject::connect(&guard, &QTimer::timeout, reply, &QNetworkReply::abort);
    guard.start(options.timeoutMs + 1000);
    loop.exec();
    guard.stop();

    std::optional<QString> text;
    if (reply->error() != QNetworkReply::NoError) {
        LOG_WARN(rcGeneration, "Generation request failed: %s",
                 qUtf8Printable(reply->errorString()));
    } else {
        text = parseResponseBody(reply->readAll());
        if (!text) {
            LOG_WARN(rcGeneration, "Generation response missing 'response' field");
        }
    }
    reply->deleteLater();

    if (text) {
        m_circuitBreaker.recordSuccess();
    } else {
        m_circuitBreaker.recordFailure();
        if (m_circuitBreaker.isOpen()) {
            LOG_WARN(rcGeneration, "Generation circuit opened after %d consecutive failures",
                     m_circuitBreaker.consecutiveFailures.load());
        }
    }
    return text;
}

} // namespace rc
