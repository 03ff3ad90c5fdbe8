#pragma once

#include <QString>

#include <optional>
#include <utility>

namespace cdir {

// Storage error codes. MigrationFailed is the only fatal one: the caller
// must stop instead of running on a partially migrated schema.
enum class StoreErrorCode : int {
    OpenFailed        = 1,
    MigrationFailed   = 2,
    PrepareFailed     = 3,
    StepFailed        = 4,
    TransactionFailed = 5,
    NotOpen           = 6,
};

QString storeErrorCodeToString(StoreErrorCode code);

struct StoreError {
    StoreErrorCode code = StoreErrorCode::StepFailed;
    int sqliteCode = 0;
    QString message;

    bool isFatal() const { return code == StoreErrorCode::MigrationFailed; }
    QString toString() const
    {
        return storeErrorCodeToString(code) + QStringLiteral(": ") + message;
    }
};

// Value-or-error holder returned by every storage operation.
template <typename T>
class StoreResult {
public:
    StoreResult(T value) : m_value(std::move(value)) {}
    StoreResult(StoreError error) : m_error(std::move(error)) {}

    bool isError() const { return m_error.has_value(); }
    explicit operator bool() const { return !isError(); }

    T& value() { return *m_value; }
    const T& value() const { return *m_value; }
    T* operator->() { return &*m_value; }
    const T* operator->() const { return &*m_value; }

    const StoreError& error() const { return *m_error; }

private:
    std::optional<T> m_value;
    std::optional<StoreError> m_error;
};

// Result of a write: true on success.
using StoreStatus = StoreResult<bool>;

inline QString storeErrorCodeToString(StoreErrorCode code)
{
    switch (code) {
    case StoreErrorCode::OpenFailed:        return QStringLiteral("OPEN_FAILED");
    case StoreErrorCode::MigrationFailed:   return QStringLiteral("MIGRATION_FAILED");
    case StoreErrorCode::PrepareFailed:     return QStringLiteral("PREPARE_FAILED");
    case StoreErrorCode::StepFailed:        return QStringLiteral("STEP_FAILED");
    case StoreErrorCode::TransactionFailed: return QStringLiteral("TRANSACTION_FAILED");
    case StoreErrorCode::NotOpen:           return QStringLiteral("NOT_OPEN");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace cdir
