#include "sse_writer.h"
#include "semantic/wire_format.h"
#include <QJsonDocument>

namespace SseWriter {

QByteArray encode(WireFormat target, const QJsonObject& event)
{
    QByteArray frame;
    if (usesNamedEvents(target)) {
        const QString type = event.value(QStringLiteral("type")).toString();
        if (!type.isEmpty()) {
            frame.append("event: ");
            frame.append(type.toUtf8());
            frame.append('\n');
        }
    }
    frame.append("data: ");
    frame.append(QJsonDocument(event).toJson(QJsonDocument::Compact));
    frame.append("\n\n");
    return frame;
}

QByteArray encodeAll(WireFormat target, const QList<QJsonObject>& events)
{
    QByteArray out;
    for (const auto& event : events)
        out.append(encode(target, event));
    return out;
}

QByteArray done()
{
    return QByteArrayLiteral("data: [DONE]\n\n");
}

} // namespace SseWriter
