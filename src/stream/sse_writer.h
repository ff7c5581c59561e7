#pragma once
#include "semantic/types.h"
#include <QByteArray>
#include <QJsonObject>
#include <QList>

// Renders translated events as text/event-stream frames for a target format.
namespace SseWriter {

// Claude frames carry "event: <type>"; every other format is data-only.
QByteArray encode(WireFormat target, const QJsonObject& event);
QByteArray encodeAll(WireFormat target, const QList<QJsonObject>& events);
QByteArray done();

} // namespace SseWriter
