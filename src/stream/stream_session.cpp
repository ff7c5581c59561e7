#include "stream_session.h"
#include "sse_writer.h"
#include "adapters/format_registry.h"
#include "core/log_manager.h"
#include <QJsonDocument>

StreamSession::StreamSession(std::shared_ptr<const IStreamTranslator> translator,
                             WireFormat target,
                             TranslationContext ctx)
    : m_translator(std::move(translator))
    , m_target(target)
    , m_ctx(std::move(ctx))
{
}

Result<std::unique_ptr<StreamSession>> StreamSession::open(const FormatRegistry& registry,
                                                           WireFormat from,
                                                           WireFormat to,
                                                           const TranslationContext& ctx)
{
    auto translator = registry.responseTranslator(from, to);
    if (!translator)
        return std::unexpected(translator.error());
    return std::make_unique<StreamSession>(*translator, to, ctx);
}

QByteArray StreamSession::feed(const QByteArray& bytes)
{
    if (m_finished)
        return {};
    return process(m_decoder.feed(bytes));
}

QByteArray StreamSession::finish()
{
    if (m_finished)
        return {};

    QByteArray out = process(m_decoder.flush());
    out.append(SseWriter::encodeAll(m_target, m_translator->close(m_state, m_ctx)));
    if (m_target == WireFormat::OpenAI)
        out.append(SseWriter::done());

    m_finished = true;
    LOG_DEBUG(QStringLiteral("StreamSession: %1 finished, %2 event(s) skipped")
                  .arg(m_translator->name())
                  .arg(m_skipped));
    return out;
}

QByteArray StreamSession::process(const QList<SseEvent>& events)
{
    QByteArray out;

    for (const auto& event : events) {
        if (m_upstreamDone)
            break;

        if (event.isDone()) {
            m_upstreamDone = true;
            m_decoder.reset();
            break;
        }

        QJsonParseError err;
        const QJsonDocument doc = QJsonDocument::fromJson(event.data, &err);
        if (err.error != QJsonParseError::NoError || !doc.isObject()) {
            ++m_skipped;
            LOG_WARNING(QStringLiteral("StreamSession: skipping unparseable event (%1)")
                            .arg(err.error != QJsonParseError::NoError
                                     ? err.errorString()
                                     : QStringLiteral("not an object")));
            continue;
        }

        QJsonObject payload = doc.object();
        // Claude streams name the event on the SSE line; keep it reachable
        // when the payload omits its own type.
        if (!event.type.isEmpty() && !payload.contains(QStringLiteral("type")))
            payload[QStringLiteral("type")] = event.type;

        out.append(SseWriter::encodeAll(m_target, m_translator->step(payload, m_state, m_ctx)));
    }

    return out;
}
