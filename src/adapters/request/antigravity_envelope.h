#pragma once
#include "semantic/ports.h"
#include <QJsonObject>

namespace AntigravityEnvelope {

// Wraps a Gemini-CLI body in the Cloud Code transport envelope. The project
// comes from ctx.credentials when set; request and session ids are fresh.
QJsonObject wrap(const QString& model, const QJsonObject& geminiCliBody,
                 const TranslationContext& ctx);

} // namespace AntigravityEnvelope
