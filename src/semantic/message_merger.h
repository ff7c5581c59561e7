#pragma once
#include "request.h"

struct MergedConversation {
    QString systemText;
    QList<Message> messages;    // roles are User or Assistant only
};

namespace MessageMerger {

// Assembles block messages for Claude-shaped targets: system text is split
// out, tool results become standalone user turns, a tool use ends its turn,
// and the last non-empty assistant turn's final block is marked cacheable.
MergedConversation merge(const QList<Message>& messages);

} // namespace MessageMerger
