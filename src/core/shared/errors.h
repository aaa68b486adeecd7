#pragma once

#include <QString>

namespace mc {

// Failure kinds reported by catalog operations. Absence of results is
// never an error.
enum class ErrorCode : int {
    NotFound         = 1,
    MissingEmbedding = 2,
    ProviderError    = 3,
    InvalidInput     = 4,
    StorageError     = 5,
};

struct CatalogError {
    ErrorCode code = ErrorCode::ProviderError;
    QString message;
};

// Fill an optional out-parameter. Safe to call with nullptr.
inline void setError(CatalogError* errorOut, ErrorCode code, const QString& message)
{
    if (errorOut) {
        errorOut->code = code;
        errorOut->message = message;
    }
}

inline QString errorCodeToString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NotFound:         return QStringLiteral("NOT_FOUND");
    case ErrorCode::MissingEmbedding: return QStringLiteral("MISSING_EMBEDDING");
    case ErrorCode::ProviderError:    return QStringLiteral("PROVIDER_ERROR");
    case ErrorCode::InvalidInput:     return QStringLiteral("INVALID_INPUT");
    case ErrorCode::StorageError:     return QStringLiteral("STORAGE_ERROR");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace mc
