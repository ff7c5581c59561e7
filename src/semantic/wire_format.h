#pragma once
#include "types.h"
#include <QString>
#include <QStringList>
#include <optional>

QString wireFormatName(WireFormat format);
std::optional<WireFormat> wireFormatFromName(const QString& name);
QStringList wireFormatNames();

// Claude-shaped streams carry named SSE events; the others are bare data lines.
inline bool usesNamedEvents(WireFormat format) {
    return format == WireFormat::Claude;
}
