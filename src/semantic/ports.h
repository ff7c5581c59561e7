#pragma once
#include "types.h"
#include "failure.h"
#include "stream_state.h"
#include "config/config_types.h"
#include <expected>
#include <optional>
#include <QJsonObject>
#include <QList>
#include <QString>

template<typename T>
using Result = std::expected<T, DomainFailure>;

class IIdProvider {
public:
    virtual ~IIdProvider() = default;
    virtual QString nextId(IdKind kind) = 0;
};

class IClock {
public:
    virtual ~IClock() = default;
    virtual qint64 nowMillis() const = 0;
};

struct Credentials {
    QString projectId;
};

// Everything a translator may consult besides its input. The providers are
// borrowed; their owner outlives every translation that uses the context.
struct TranslationContext {
    IIdProvider* ids = nullptr;
    const IClock* clock = nullptr;
    TranslatorOptions options;
    std::optional<Credentials> credentials;

    QString nextId(IdKind kind) const;
    qint64 nowMillis() const;
    qint64 nowSeconds() const { return nowMillis() / 1000; }
};

class IRequestTranslator {
public:
    virtual ~IRequestTranslator() = default;
    virtual QString name() const = 0;
    virtual QJsonObject translate(const QString& model,
                                  const QJsonObject& body,
                                  bool stream,
                                  const TranslationContext& ctx) const = 0;
};

class IStreamTranslator {
public:
    virtual ~IStreamTranslator() = default;
    virtual QString name() const = 0;
    virtual QList<QJsonObject> step(const QJsonObject& event,
                                    StreamState& state,
                                    const TranslationContext& ctx) const = 0;
    // Called once when the provider stream ends. Emits the terminal events
    // the provider never triggered and closes every block still open.
    virtual QList<QJsonObject> close(StreamState& state,
                                     const TranslationContext& ctx) const = 0;
};
