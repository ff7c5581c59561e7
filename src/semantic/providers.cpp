#include "providers.h"
#include <QDateTime>
#include <QRandomGenerator>
#include <QUuid>

namespace {

const char* const kAdjectives[] = {"useful", "bright", "swift", "calm", "bold"};
const char* const kNouns[] = {"fuze", "wave", "spark", "flow", "core"};

} // namespace

// -----------------------------------------------------------------------------
// SystemIdProvider
// -----------------------------------------------------------------------------

QString SystemIdProvider::nextId(IdKind kind)
{
    auto* rng = QRandomGenerator::global();
    switch (kind) {
    case IdKind::Request:
        return QStringLiteral("agent-") + QUuid::createUuid().toString(QUuid::WithoutBraces);
    case IdKind::Session:
        return QStringLiteral("-") + randomDigits(19);
    case IdKind::Project: {
        const QString adjective = QString::fromLatin1(kAdjectives[rng->bounded(5)]);
        const QString noun = QString::fromLatin1(kNouns[rng->bounded(5)]);
        return QStringLiteral("%1-%2-%3").arg(adjective, noun, randomBase36(5));
    }
    case IdKind::Message:
        return QStringLiteral("msg_") + QUuid::createUuid().toString(QUuid::Id128).left(24);
    }
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

SystemIdProvider& SystemIdProvider::shared()
{
    static SystemIdProvider s_instance;
    return s_instance;
}

QString SystemIdProvider::randomDigits(int count)
{
    auto* rng = QRandomGenerator::global();
    QString out;
    out.reserve(count);
    out.append(QChar('1' + rng->bounded(9)));
    for (int i = 1; i < count; ++i)
        out.append(QChar('0' + rng->bounded(10)));
    return out;
}

QString SystemIdProvider::randomBase36(int count)
{
    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    auto* rng = QRandomGenerator::global();
    QString out;
    out.reserve(count);
    for (int i = 0; i < count; ++i)
        out.append(QChar::fromLatin1(kAlphabet[rng->bounded(36)]));
    return out;
}

// -----------------------------------------------------------------------------
// SystemClock
// -----------------------------------------------------------------------------

qint64 SystemClock::nowMillis() const
{
    return QDateTime::currentMSecsSinceEpoch();
}

const SystemClock& SystemClock::shared()
{
    static SystemClock s_instance;
    return s_instance;
}

// -----------------------------------------------------------------------------
// TranslationContext
// -----------------------------------------------------------------------------

QString TranslationContext::nextId(IdKind kind) const
{
    IIdProvider* provider = ids ? ids : &SystemIdProvider::shared();
    return provider->nextId(kind);
}

qint64 TranslationContext::nowMillis() const
{
    const IClock* source = clock ? clock : &SystemClock::shared();
    return source->nowMillis();
}
