#include "format_registry.h"
#include "adapters/request/claude_request.h"
#include "adapters/request/gemini_request.h"
#include "adapters/stream/claude_to_openai.h"
#include "adapters/stream/gemini_to_openai.h"
#include "adapters/stream/openai_to_claude.h"
#include "semantic/wire_format.h"
#include "core/log_manager.h"
#include <QJsonDocument>

namespace {

QString pairLabel(WireFormat from, WireFormat to)
{
    return QStringLiteral("%1->%2").arg(wireFormatName(from), wireFormatName(to));
}

} // namespace

void FormatRegistry::registerRequest(WireFormat from, WireFormat to,
                                     std::shared_ptr<const IRequestTranslator> translator)
{
    if (!translator)
        return;
    m_pairs[qMakePair(from, to)].request = std::move(translator);
}

void FormatRegistry::registerResponse(WireFormat from, WireFormat to,
                                      std::shared_ptr<const IStreamTranslator> translator)
{
    if (!translator)
        return;
    m_pairs[qMakePair(from, to)].response = std::move(translator);
}

TranslatorPair FormatRegistry::lookup(WireFormat from, WireFormat to) const
{
    return m_pairs.value(qMakePair(from, to));
}

QList<QPair<WireFormat, WireFormat>> FormatRegistry::registeredPairs() const
{
    return m_pairs.keys();
}

Result<QJsonObject> FormatRegistry::translateRequest(WireFormat from, WireFormat to,
                                                     const QString& model,
                                                     const QByteArray& body,
                                                     bool stream,
                                                     const TranslationContext& ctx) const
{
    const TranslatorPair pair = lookup(from, to);
    if (!pair.request) {
        LOG_WARNING(QStringLiteral("FormatRegistry: no request translator for %1").arg(pairLabel(from, to)));
        return std::unexpected(DomainFailure::notSupported(
            QStringLiteral("unsupported_pair"),
            QStringLiteral("No request translator for %1").arg(pairLabel(from, to))));
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        const QString reason = err.error != QJsonParseError::NoError
            ? err.errorString()
            : QStringLiteral("body is not a JSON object");
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_json"),
            QStringLiteral("Request body could not be parsed: %1").arg(reason)));
    }

    LOG_DEBUG(QStringLiteral("FormatRegistry: translating request with %1").arg(pair.request->name()));
    return pair.request->translate(model, doc.object(), stream, ctx);
}

Result<std::shared_ptr<const IStreamTranslator>> FormatRegistry::responseTranslator(WireFormat from,
                                                                                    WireFormat to) const
{
    const TranslatorPair pair = lookup(from, to);
    if (!pair.response) {
        LOG_WARNING(QStringLiteral("FormatRegistry: no response translator for %1").arg(pairLabel(from, to)));
        return std::unexpected(DomainFailure::notSupported(
            QStringLiteral("unsupported_pair"),
            QStringLiteral("No response translator for %1").arg(pairLabel(from, to))));
    }
    return pair.response;
}

FormatRegistry FormatRegistry::createDefault()
{
    FormatRegistry registry;

    registry.registerRequest(WireFormat::OpenAI, WireFormat::Claude,
                             std::make_shared<OpenAiToClaudeRequest>());
    registry.registerRequest(WireFormat::OpenAI, WireFormat::Gemini,
                             std::make_shared<OpenAiToGeminiRequest>());
    registry.registerRequest(WireFormat::OpenAI, WireFormat::GeminiCli,
                             std::make_shared<OpenAiToGeminiCliRequest>());
    registry.registerRequest(WireFormat::OpenAI, WireFormat::Antigravity,
                             std::make_shared<OpenAiToAntigravityRequest>());

    registry.registerResponse(WireFormat::OpenAI, WireFormat::Claude,
                              std::make_shared<OpenAiToClaudeStream>());
    registry.registerResponse(WireFormat::Claude, WireFormat::OpenAI,
                              std::make_shared<ClaudeToOpenAiStream>());

    // All Gemini variants stream the same candidate shape.
    auto gemini = std::make_shared<GeminiToOpenAiStream>();
    registry.registerResponse(WireFormat::Gemini, WireFormat::OpenAI, gemini);
    registry.registerResponse(WireFormat::GeminiCli, WireFormat::OpenAI, gemini);
    registry.registerResponse(WireFormat::Antigravity, WireFormat::OpenAI, gemini);

    return registry;
}
