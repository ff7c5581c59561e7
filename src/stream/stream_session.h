#pragma once
#include "sse_decoder.h"
#include "semantic/ports.h"
#include <QByteArray>
#include <memory>

class FormatRegistry;

// Drives one provider stream through a stream translator: SSE bytes in,
// re-encoded SSE bytes out. One session per exchange; not thread-safe.
class StreamSession {
public:
    StreamSession(std::shared_ptr<const IStreamTranslator> translator,
                  WireFormat target,
                  TranslationContext ctx);

    static Result<std::unique_ptr<StreamSession>> open(const FormatRegistry& registry,
                                                       WireFormat from,
                                                       WireFormat to,
                                                       const TranslationContext& ctx);

    QByteArray feed(const QByteArray& bytes);
    // Flushes any unterminated event and lets the translator close whatever
    // the provider left open. OpenAI output gets its [DONE] sentinel.
    QByteArray finish();

    bool upstreamDone() const { return m_upstreamDone; }
    bool isFinished() const { return m_finished; }
    int skippedEvents() const { return m_skipped; }
    const StreamState& state() const { return m_state; }

private:
    std::shared_ptr<const IStreamTranslator> m_translator;
    WireFormat m_target;
    TranslationContext m_ctx;
    StreamState m_state;
    SseDecoder m_decoder;
    bool m_upstreamDone = false;
    bool m_finished = false;
    int m_skipped = 0;

    QByteArray process(const QList<SseEvent>& events);
};
