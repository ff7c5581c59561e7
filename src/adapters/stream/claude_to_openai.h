#pragma once
#include "semantic/ports.h"

// Claude message events -> OpenAI chat.completion.chunk objects.
class ClaudeToOpenAiStream : public IStreamTranslator {
public:
    ClaudeToOpenAiStream() = default;
    ~ClaudeToOpenAiStream() override = default;

    QString name() const override;

    QList<QJsonObject> step(const QJsonObject& event,
                            StreamState& state,
                            const TranslationContext& ctx) const override;
    QList<QJsonObject> close(StreamState& state,
                             const TranslationContext& ctx) const override;

    static constexpr const char* kThinkOpen = "<think>";
    static constexpr const char* kThinkClose = "</think>";

private:
    void onMessageStart(const QJsonObject& event, StreamState& state,
                        const TranslationContext& ctx, QList<QJsonObject>& out) const;
    void onBlockStart(const QJsonObject& event, StreamState& state,
                      const TranslationContext& ctx, QList<QJsonObject>& out) const;
    void onBlockDelta(const QJsonObject& event, StreamState& state,
                      const TranslationContext& ctx, QList<QJsonObject>& out) const;
    void onBlockStop(const QJsonObject& event, StreamState& state,
                     const TranslationContext& ctx, QList<QJsonObject>& out) const;
    void onMessageDelta(const QJsonObject& event, StreamState& state,
                        const TranslationContext& ctx, QList<QJsonObject>& out) const;
    void onMessageStop(StreamState& state, const TranslationContext& ctx,
                       QList<QJsonObject>& out) const;
    QJsonObject errorEvent(const QJsonObject& event) const;
};
