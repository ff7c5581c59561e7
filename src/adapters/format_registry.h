#pragma once
#include "semantic/ports.h"
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QPair>
#include <memory>

// One direction may be missing for a pair; callers must not invoke it.
struct TranslatorPair {
    std::shared_ptr<const IRequestTranslator> request;
    std::shared_ptr<const IStreamTranslator> response;

    bool isEmpty() const { return !request && !response; }
};

// Keyed by (from, to) in the direction data flows: a request translator
// turns a `from` body into a `to` body, a response translator turns `from`
// stream events into `to` stream events. Registration happens before any
// lookup; lookups are read-only afterwards and may run concurrently.
class FormatRegistry {
public:
    FormatRegistry() = default;

    void registerRequest(WireFormat from, WireFormat to,
                         std::shared_ptr<const IRequestTranslator> translator);
    void registerResponse(WireFormat from, WireFormat to,
                          std::shared_ptr<const IStreamTranslator> translator);

    TranslatorPair lookup(WireFormat from, WireFormat to) const;
    QList<QPair<WireFormat, WireFormat>> registeredPairs() const;

    Result<QJsonObject> translateRequest(WireFormat from, WireFormat to,
                                         const QString& model,
                                         const QByteArray& body,
                                         bool stream,
                                         const TranslationContext& ctx) const;

    Result<std::shared_ptr<const IStreamTranslator>> responseTranslator(WireFormat from,
                                                                        WireFormat to) const;

    static FormatRegistry createDefault();

private:
    QMap<QPair<WireFormat, WireFormat>, TranslatorPair> m_pairs;
};
