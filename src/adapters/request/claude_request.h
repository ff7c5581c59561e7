#pragma once
#include "semantic/ports.h"
#include "semantic/request.h"
#include <QJsonArray>

class OpenAiToClaudeRequest : public IRequestTranslator {
public:
    OpenAiToClaudeRequest() = default;
    ~OpenAiToClaudeRequest() override = default;

    QString name() const override;

    QJsonObject translate(const QString& model,
                          const QJsonObject& body,
                          bool stream,
                          const TranslationContext& ctx) const override;

    static int resolveMaxTokens(const RequestModel& request, const TranslatorOptions& options);
    static QJsonObject mapToolChoice(const QJsonValue& choice);

private:
    QJsonArray buildMessages(const QList<Message>& messages) const;
    QJsonObject renderBlock(const ContentBlock& block) const;
    QJsonArray buildSystem(const QString& systemText, const TranslatorOptions& options) const;
    QJsonArray buildToolDefs(const QList<ToolSpec>& tools) const;
};
