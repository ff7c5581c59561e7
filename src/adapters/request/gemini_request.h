#pragma once
#include "semantic/ports.h"
#include "semantic/request.h"
#include <QJsonArray>
#include <QMap>

class OpenAiToGeminiRequest : public IRequestTranslator {
public:
    OpenAiToGeminiRequest() = default;
    ~OpenAiToGeminiRequest() override = default;

    QString name() const override;

    QJsonObject translate(const QString& model,
                          const QJsonObject& body,
                          bool stream,
                          const TranslationContext& ctx) const override;

    // Looks the id up in knownNames, else reads it as "<name>-<timestamp>-<index>".
    // The fallback is lossy: any id with more than two '-' segments is cut.
    static QString resolveToolName(const QString& callId, const QMap<QString, QString>& knownNames);
    static QJsonArray defaultSafetySettings();

protected:
    QJsonObject buildBody(const RequestModel& request, const TranslationContext& ctx) const;

    virtual QJsonObject buildGenerationConfig(const RequestModel& request,
                                              const TranslatorOptions& options) const;
    virtual QJsonObject buildDeclaration(const ToolSpec& tool, const RequestModel& request) const;

private:
    QJsonArray buildContents(const QList<Message>& messages,
                             const TranslatorOptions& options,
                             QStringList& systemTexts) const;
    QJsonArray userParts(const Message& message) const;
    QJsonObject functionResponseValue(const QJsonValue& raw) const;
};

class OpenAiToGeminiCliRequest : public OpenAiToGeminiRequest {
public:
    QString name() const override;

    static int resolveThinkingBudget(const RequestModel& request, const TranslatorOptions& options);

protected:
    QJsonObject buildGenerationConfig(const RequestModel& request,
                                      const TranslatorOptions& options) const override;
    QJsonObject buildDeclaration(const ToolSpec& tool, const RequestModel& request) const override;
};

class OpenAiToAntigravityRequest : public OpenAiToGeminiCliRequest {
public:
    QString name() const override;

    QJsonObject translate(const QString& model,
                          const QJsonObject& body,
                          bool stream,
                          const TranslationContext& ctx) const override;
};
