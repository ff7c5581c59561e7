#include "message_merger.h"
#include <QStringList>

namespace {

class Accumulator {
public:
    explicit Accumulator(QList<Message>& out) : m_out(out) {}

    bool hasRole() const { return m_hasRole; }
    MessageRole role() const { return m_role; }

    void start(MessageRole role) {
        m_role = role;
        m_hasRole = true;
    }

    void append(const QList<ContentBlock>& blocks) { m_blocks.append(blocks); }

    void flush() {
        if (!m_hasRole || m_blocks.isEmpty())
            return;
        m_out.append(Message{m_role, m_blocks});
        m_blocks.clear();
    }

private:
    QList<Message>& m_out;
    MessageRole m_role = MessageRole::User;
    bool m_hasRole = false;
    QList<ContentBlock> m_blocks;
};

MessageRole mergedRole(MessageRole role)
{
    return (role == MessageRole::User || role == MessageRole::Tool)
        ? MessageRole::User
        : MessageRole::Assistant;
}

void markCachePrefix(QList<Message>& messages)
{
    for (qsizetype i = messages.size() - 1; i >= 0; --i) {
        Message& message = messages[i];
        if (message.role == MessageRole::Assistant && !message.blocks.isEmpty()) {
            message.blocks.last().cacheEligible = true;
            return;
        }
    }
}

} // namespace

namespace MessageMerger {

MergedConversation merge(const QList<Message>& messages)
{
    MergedConversation result;

    QStringList systemParts;
    for (const auto& message : messages) {
        if (message.role == MessageRole::System)
            systemParts.append(message.joinedText());
    }
    result.systemText = systemParts.join('\n');

    Accumulator pending(result.messages);

    for (const auto& message : messages) {
        if (message.role == MessageRole::System)
            continue;

        const MessageRole role = mergedRole(message.role);

        if (message.contains(BlockKind::ToolResult)) {
            QList<ContentBlock> toolResults;
            QList<ContentBlock> others;
            for (const auto& block : message.blocks) {
                if (block.kind == BlockKind::ToolResult)
                    toolResults.append(block);
                else
                    others.append(block);
            }

            pending.flush();
            result.messages.append(Message{MessageRole::User, toolResults});

            if (!others.isEmpty()) {
                pending.start(role);
                pending.append(others);
            }
            continue;
        }

        if (!pending.hasRole() || pending.role() != role) {
            pending.flush();
            pending.start(role);
        }

        pending.append(message.blocks);

        if (message.contains(BlockKind::ToolUse))
            pending.flush();
    }

    pending.flush();
    markCachePrefix(result.messages);
    return result;
}

} // namespace MessageMerger
