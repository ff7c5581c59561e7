#pragma once
#include "semantic/ports.h"
#include <QJsonArray>

// OpenAI chat.completion.chunk objects -> Claude message events.
class OpenAiToClaudeStream : public IStreamTranslator {
public:
    OpenAiToClaudeStream() = default;
    ~OpenAiToClaudeStream() override = default;

    QString name() const override;

    QList<QJsonObject> step(const QJsonObject& event,
                            StreamState& state,
                            const TranslationContext& ctx) const override;
    QList<QJsonObject> close(StreamState& state,
                             const TranslationContext& ctx) const override;

    static QString resolveMessageId(const QJsonObject& chunk, const TranslationContext& ctx);

private:
    QJsonObject messageStart(const StreamState& state) const;
    void openBlock(OpenBlock kind, StreamState& state, QList<QJsonObject>& out) const;
    void closeOpenBlock(StreamState& state, QList<QJsonObject>& out) const;
    void handleToolCalls(const QJsonArray& toolCalls, StreamState& state,
                         QList<QJsonObject>& out) const;
    void finish(const QString& finishReason, StreamState& state, QList<QJsonObject>& out) const;
    void recordUsage(const QJsonObject& usage, StreamState& state) const;
};
