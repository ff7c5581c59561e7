#pragma once
#include "semantic/ports.h"
#include <QJsonArray>

// Gemini / Gemini-CLI / Antigravity streamGenerateContent chunks -> OpenAI
// chat.completion.chunk objects. The Cloud Code "response" envelope is unwrapped.
class GeminiToOpenAiStream : public IStreamTranslator {
public:
    GeminiToOpenAiStream() = default;
    ~GeminiToOpenAiStream() override = default;

    QString name() const override;

    QList<QJsonObject> step(const QJsonObject& event,
                            StreamState& state,
                            const TranslationContext& ctx) const override;
    QList<QJsonObject> close(StreamState& state,
                             const TranslationContext& ctx) const override;

private:
    void foldUsage(const QJsonObject& usage, StreamState& state) const;
    void emitParts(const QJsonArray& parts, StreamState& state,
                   const TranslationContext& ctx, QList<QJsonObject>& out) const;
    QJsonObject toolCallChunk(const QJsonObject& functionCall, StreamState& state,
                              const TranslationContext& ctx) const;
};
