#pragma once

#include "core/shared/settings.h"

#include <QStringList>
#include <QTextStream>

namespace cdir {

class ImportExport;
class PathIndex;
class SchemaStore;
class ShortcutRegistry;

// Command-line front end. Parses `arguments` (argv[0] included), loads the
// settings, opens the database and runs one command.
//
// Exit codes: 0 success, 1 usage or operation failure, 2 fatal database
// migration failure.
class CliApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitFatal = 2;

    CliApp(QTextStream& out, QTextStream& err);

    int run(const QStringList& arguments);

private:
    struct Context {
        SchemaStore& store;
        PathIndex& paths;
        ShortcutRegistry& shortcuts;
        ImportExport& importExport;
    };

    int dispatch(const QString& command, const QStringList& args, Context& ctx);

    int addPath(const QStringList& args, Context& ctx);
    int deletePath(const QStringList& args, Context& ctx);
    int listPaths(const QStringList& args, Context& ctx);
    int lasts(Context& ctx);
    int history(const QStringList& args, Context& ctx);
    int suggest(const QStringList& args, Context& ctx);
    int addShortcut(const QStringList& args, Context& ctx);
    int deleteShortcut(const QStringList& args, Context& ctx);
    int printShortcut(const QStringList& args, Context& ctx);
    int listShortcuts(const QStringList& args, Context& ctx);
    int prettyPrint(const QStringList& args, Context& ctx);
    int importFile(const QString& command, const QStringList& args, Context& ctx);
    int exportFile(const QString& command, const QStringList& args, Context& ctx);

    int usageError(const QString& message);
    QString formatDate(int64_t timestamp) const;

    QTextStream& m_out;
    QTextStream& m_err;
    Settings m_settings;
    QString m_settingsPath;

    // Per-command options
    bool m_fuzzy = false;
    int m_limit = 10;
    int m_offset = 0;
    int m_maxWidth = -1;
    int64_t m_date = -1;
};

} // namespace cdir
