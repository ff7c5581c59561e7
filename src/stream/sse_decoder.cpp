#include "sse_decoder.h"

QList<SseEvent> SseDecoder::feed(const QByteArray& bytes)
{
    m_buffer.append(bytes);
    return drain();
}

QList<SseEvent> SseDecoder::flush()
{
    if (m_buffer.trimmed().isEmpty()) {
        m_buffer.clear();
        return {};
    }
    m_buffer.append("\n\n");
    return drain();
}

void SseDecoder::reset()
{
    m_buffer.clear();
}

QList<SseEvent> SseDecoder::drain()
{
    QList<SseEvent> events;

    while (true) {
        // "\r\n\r\n" is checked first so a CRLF stream is not split on its
        // embedded "\n".
        qsizetype delimPos = -1;
        qsizetype delimLen = 0;

        const qsizetype crlfPos = m_buffer.indexOf("\r\n\r\n");
        const qsizetype lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0)
            break;

        const QByteArray block = m_buffer.left(delimPos);
        m_buffer.remove(0, delimPos + delimLen);

        SseEvent event;
        if (parseBlock(block, event))
            events.append(event);
    }

    return events;
}

bool SseDecoder::parseBlock(const QByteArray& block, SseEvent& event)
{
    QList<QByteArray> dataLines;

    for (const QByteArray& rawLine : block.split('\n')) {
        QByteArray line = rawLine;
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty() || line.startsWith(':'))
            continue;

        if (line.startsWith("event:")) {
            event.type = QString::fromUtf8(line.mid(6).trimmed());
        } else if (line.startsWith("data:")) {
            dataLines.append(line.mid(5).trimmed());
        }
        // id:, retry: and unknown fields are ignored.
    }

    // An event with no data lines carries nothing to translate.
    if (dataLines.isEmpty())
        return false;

    event.data = dataLines.join('\n');
    return true;
}
