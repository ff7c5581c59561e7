#include "antigravity_envelope.h"

namespace AntigravityEnvelope {

QJsonObject wrap(const QString& model, const QJsonObject& geminiCliBody,
                 const TranslationContext& ctx)
{
    QString project;
    if (ctx.credentials.has_value())
        project = ctx.credentials->projectId.trimmed();
    if (project.isEmpty())
        project = ctx.nextId(IdKind::Project);

    QJsonObject request;
    request[QStringLiteral("sessionId")] = ctx.nextId(IdKind::Session);
    static const char* const kForwarded[] = {
        "contents", "systemInstruction", "generationConfig", "safetySettings", "tools"
    };
    for (const char* key : kForwarded) {
        const QString field = QString::fromLatin1(key);
        if (geminiCliBody.contains(field))
            request[field] = geminiCliBody.value(field);
    }

    QJsonObject envelope;
    envelope[QStringLiteral("project")] = project;
    envelope[QStringLiteral("model")] = model;
    envelope[QStringLiteral("userAgent")] = ctx.options.envelopeUserAgent;
    envelope[QStringLiteral("requestId")] = ctx.nextId(IdKind::Request);
    envelope[QStringLiteral("request")] = request;
    return envelope;
}

} // namespace AntigravityEnvelope
