#pragma once
#include <QByteArray>
#include <QList>
#include <QString>

struct SseEvent {
    QString type;     // "event:" field, empty when absent
    QByteArray data;  // data lines joined with '\n'

    bool isDone() const { return data == "[DONE]"; }
};

// Incremental text/event-stream parser. Bytes may arrive split anywhere,
// including inside a delimiter.
class SseDecoder {
public:
    QList<SseEvent> feed(const QByteArray& bytes);
    // Emits a trailing event that was never terminated by a blank line.
    QList<SseEvent> flush();

    bool hasPendingData() const { return !m_buffer.isEmpty(); }
    void reset();

private:
    QByteArray m_buffer;

    QList<SseEvent> drain();
    static bool parseBlock(const QByteArray& block, SseEvent& event);
};
