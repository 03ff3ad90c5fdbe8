#pragma once

#include <QByteArray>
#include <QString>

#include <sqlite3.h>

#include <optional>

namespace cdir {

// Binds UTF-8 text kept alive by the caller (SQLITE_STATIC).
inline int bindUtf8(sqlite3_stmt* stmt, int index, const QByteArray& utf8)
{
    return sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_STATIC);
}

inline QString columnString(sqlite3_stmt* stmt, int column)
{
    const char* raw = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return raw ? QString::fromUtf8(raw) : QString();
}

inline std::optional<QString> columnOptionalString(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnString(stmt, column);
}

} // namespace cdir
