#pragma once
#include "ports.h"

// Random identifiers backed by QUuid and QRandomGenerator::global(); safe to
// share between threads.
class SystemIdProvider : public IIdProvider {
public:
    QString nextId(IdKind kind) override;

    static SystemIdProvider& shared();

private:
    static QString randomDigits(int count);
    static QString randomBase36(int count);
};

class SystemClock : public IClock {
public:
    qint64 nowMillis() const override;

    static const SystemClock& shared();
};
