#include "failure.h"

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:  return 400;
    case ErrorKind::NotSupported:  return 501;
    case ErrorKind::Internal:
    default:                       return 500;
    }
}

QString DomainFailure::kindName() const {
    switch (kind) {
    case ErrorKind::InvalidInput:  return QStringLiteral("invalid_request_error");
    case ErrorKind::NotSupported:  return QStringLiteral("not_supported_error");
    case ErrorKind::Internal:
    default:                       return QStringLiteral("internal_error");
    }
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["code"] = code;
    err["message"] = message;
    err["type"] = kindName();
    QJsonObject root;
    root["error"] = err;
    return root;
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg};
}

DomainFailure DomainFailure::notSupported(const QString& code, const QString& msg) {
    return {ErrorKind::NotSupported, code, msg};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg};
}
