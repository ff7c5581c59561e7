#pragma once
#include "semantic/ports.h"
#include <QJsonObject>
#include <QJsonValue>

namespace openai_chunk {

// {id:"chatcmpl-<messageId>", object:"chat.completion.chunk", created, model,
//  choices:[{index:0, delta, finish_reason}]}
QJsonObject make(const StreamState& state, const TranslationContext& ctx,
                 const QJsonObject& delta, const QJsonValue& finishReason = QJsonValue());

QJsonObject terminal(const StreamState& state, const TranslationContext& ctx,
                     const QString& finishReason);

QJsonObject usage(const UsageCounters& counters);

QJsonObject contentDelta(const QString& key, const QString& text);

} // namespace openai_chunk
