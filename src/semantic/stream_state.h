#pragma once
#include "types.h"
#include <QString>
#include <QList>
#include <QMap>
#include <optional>

struct ToolCallEntry {
    int providerIndex = -1;
    int outputIndex = -1;
    QString id;
    QString name;
    QString argumentBuffer;
};

// Tool calls of one exchange, looked up by the provider's index. Each entry
// records the output index it was given. Entries are kept in opening order.
class ToolCallTable {
public:
    ToolCallEntry& open(int providerIndex, int outputIndex,
                        const QString& id, const QString& name);

    ToolCallEntry* byProviderIndex(int providerIndex);
    const ToolCallEntry* byProviderIndex(int providerIndex) const;

    void appendArguments(int providerIndex, const QString& fragment);

    const QList<ToolCallEntry>& entries() const { return m_entries; }
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }
    void clear();

private:
    QList<ToolCallEntry> m_entries;
    QMap<int, int> m_byProvider;
};

struct UsageCounters {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;
    int reasoningTokens = 0;
};

struct StreamState {
    QString messageId;
    QString modelName;
    bool messageStarted = false;

    OpenBlock openBlock = OpenBlock::None;
    int openBlockIndex = -1;

    int nextBlockIndex = 0;
    int nextToolCallIndex = 0;
    ToolCallTable toolCalls;

    std::optional<QString> finishReason;
    bool finishReasonSent = false;

    std::optional<UsageCounters> usage;

    bool isOpen(OpenBlock kind) const { return openBlock == kind; }
    int allocateBlockIndex() { return nextBlockIndex++; }
    int allocateToolCallIndex() { return nextToolCallIndex++; }
    void setOpenBlock(OpenBlock kind, int index) {
        openBlock = kind;
        openBlockIndex = index;
    }
    void clearOpenBlock() {
        openBlock = OpenBlock::None;
        openBlockIndex = -1;
    }
};
