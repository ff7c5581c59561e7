#pragma once
#include <QString>

// Claude stop_reason -> OpenAI finish_reason. Unknown reasons map to "stop".
QString finishReasonFromStopReason(const QString& stopReason);

// OpenAI finish_reason -> Claude stop_reason. Unknown reasons map to "end_turn".
QString stopReasonFromFinishReason(const QString& finishReason);
