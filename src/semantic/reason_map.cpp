#include "reason_map.h"

QString finishReasonFromStopReason(const QString& stopReason)
{
    if (stopReason == QLatin1String("max_tokens"))
        return QStringLiteral("length");
    if (stopReason == QLatin1String("tool_use"))
        return QStringLiteral("tool_calls");
    // end_turn, stop_sequence and anything unrecognised
    return QStringLiteral("stop");
}

QString stopReasonFromFinishReason(const QString& finishReason)
{
    if (finishReason == QLatin1String("length"))
        return QStringLiteral("max_tokens");
    if (finishReason == QLatin1String("tool_calls"))
        return QStringLiteral("tool_use");
    return QStringLiteral("end_turn");
}
