#include "stream_state.h"

ToolCallEntry& ToolCallTable::open(int providerIndex, int outputIndex,
                                   const QString& id, const QString& name)
{
    ToolCallEntry entry;
    entry.providerIndex = providerIndex;
    entry.outputIndex = outputIndex;
    entry.id = id;
    entry.name = name;
    m_entries.append(entry);

    const int slot = m_entries.size() - 1;
    // A provider index that is reused for a new call points at the newest
    // entry; the older entry stays in the table so it can still be closed.
    m_byProvider.insert(providerIndex, slot);
    return m_entries[slot];
}

ToolCallEntry* ToolCallTable::byProviderIndex(int providerIndex)
{
    auto it = m_byProvider.constFind(providerIndex);
    if (it == m_byProvider.constEnd())
        return nullptr;
    return &m_entries[it.value()];
}

const ToolCallEntry* ToolCallTable::byProviderIndex(int providerIndex) const
{
    auto it = m_byProvider.constFind(providerIndex);
    if (it == m_byProvider.constEnd())
        return nullptr;
    return &m_entries[it.value()];
}

void ToolCallTable::appendArguments(int providerIndex, const QString& fragment)
{
    if (ToolCallEntry* entry = byProviderIndex(providerIndex))
        entry->argumentBuffer.append(fragment);
}

void ToolCallTable::clear()
{
    m_entries.clear();
    m_byProvider.clear();
}
