#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;

    int httpStatus() const;
    QString kindName() const;
    QJsonObject toJson() const;

    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure notSupported(const QString& code, const QString& msg);
    static DomainFailure internal(const QString& msg);
};
