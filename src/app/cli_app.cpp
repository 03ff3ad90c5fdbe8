#include "app/cli_app.h"
#include "core/format/path_shortener.h"
#include "core/index/path_index.h"
#include "core/index/schema_store.h"
#include "core/index/shortcut_registry.h"
#include "core/io/import_export.h"
#include "core/ranking/smart_suggester.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDateTime>
#include <QLoggingCategory>

#include <limits>

namespace cdir {

namespace {

const QString kDescription = QStringLiteral(
    "Remembers visited directories and named shortcuts.\n"
    "\n"
    "Commands:\n"
    "  add-path <dir>                      record a visit (--date to backdate)\n"
    "  delete-path <id>                    remove a directory from the current set\n"
    "  paths [filter]                      list directories, newest first\n"
    "  lasts                               print the last visited directories\n"
    "  history [filter]                    list the visit log\n"
    "  suggest [dir]                       predict the next directories after <dir>\n"
    "  add-shortcut <name> <dir> [desc]    bind a name to a directory\n"
    "  delete-shortcut <name>              remove a shortcut\n"
    "  print-shortcut <name>               print the directory of a shortcut\n"
    "  shortcuts [filter]                  list shortcuts\n"
    "  pretty-print <dir>                  render a directory with shortcuts and ~\n"
    "  import-paths <file>                 bulk import directories\n"
    "  import-shortcuts <file>             bulk import shortcuts\n"
    "  export-paths <file>                 export the current directory set\n"
    "  export-shortcuts <file>             export all shortcuts\n"
    "  config-file                         print the settings file location\n"
    "\n"
    "Import and export files are JSON, or YAML when named *.yaml or *.yml.");

} // namespace

CliApp::CliApp(QTextStream& out, QTextStream& err)
    : m_out(out)
    , m_err(err)
{
}

int CliApp::run(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(kDescription);
    const QCommandLineOption helpOption = parser.addHelpOption();

    const QCommandLineOption configOption(QStringLiteral("config"),
        QStringLiteral("Settings file (default: $CDIR_CONFIG or the user config directory)."),
        QStringLiteral("file"));
    const QCommandLineOption dbOption(QStringLiteral("db"),
        QStringLiteral("Database file, overrides the settings."), QStringLiteral("file"));
    const QCommandLineOption fuzzyOption(QStringLiteral("fuzzy"),
        QStringLiteral("Fuzzy instead of substring filtering."));
    const QCommandLineOption limitOption(QStringLiteral("limit"),
        QStringLiteral("Maximum number of rows (default 10)."), QStringLiteral("n"));
    const QCommandLineOption offsetOption(QStringLiteral("offset"),
        QStringLiteral("Rows to skip."), QStringLiteral("n"));
    const QCommandLineOption dateOption(QStringLiteral("date"),
        QStringLiteral("Visit time in seconds since the epoch."), QStringLiteral("seconds"));
    const QCommandLineOption maxWidthOption(QStringLiteral("max-width"),
        QStringLiteral("Maximum width of the rendered directory."), QStringLiteral("n"));
    const QCommandLineOption cwdOption(QStringLiteral("cwd"),
        QStringLiteral("Current directory used as the suggestion anchor."), QStringLiteral("dir"));

    parser.addOptions({configOption, dbOption, fuzzyOption, limitOption, offsetOption,
                       dateOption, maxWidthOption, cwdOption});
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."),
                                 QStringLiteral("[args...]"));

    if (!parser.parse(arguments)) {
        return usageError(parser.errorText());
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return kExitOk;
    }

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        m_out << parser.helpText();
        return kExitFailure;
    }
    const QString command = positional.takeFirst();

    // Numeric options
    bool ok = true;
    m_fuzzy = parser.isSet(fuzzyOption);
    if (parser.isSet(limitOption)) {
        m_limit = parser.value(limitOption).toInt(&ok);
        if (!ok || m_limit < 0) {
            return usageError(QStringLiteral("invalid --limit"));
        }
    }
    if (parser.isSet(offsetOption)) {
        m_offset = parser.value(offsetOption).toInt(&ok);
        if (!ok || m_offset < 0) {
            return usageError(QStringLiteral("invalid --offset"));
        }
    }
    if (parser.isSet(maxWidthOption)) {
        m_maxWidth = parser.value(maxWidthOption).toInt(&ok);
        if (!ok || m_maxWidth < 0) {
            return usageError(QStringLiteral("invalid --max-width"));
        }
    }
    if (parser.isSet(dateOption)) {
        m_date = parser.value(dateOption).toLongLong(&ok);
        if (!ok || m_date < 0) {
            return usageError(QStringLiteral("invalid --date"));
        }
    }

    // Settings
    m_settingsPath = SettingsManager::settingsFilePath(parser.value(configOption));
    if (command == QLatin1String("config-file")) {
        m_out << m_settingsPath << '\n';
        return kExitOk;
    }

    const std::optional<Settings> loaded = SettingsManager::load(m_settingsPath);
    if (!loaded) {
        m_err << "cdir: cannot read settings file " << m_settingsPath << '\n';
        return kExitFailure;
    }
    m_settings = *loaded;
    if (parser.isSet(dbOption)) {
        m_settings.dbPath = parser.value(dbOption);
    }
    m_settings.currentDirectory = parser.isSet(cwdOption) ? parser.value(cwdOption) : QString();
    if (!m_settings.logRules.isEmpty()) {
        QLoggingCategory::setFilterRules(m_settings.logRules);
    }

    // Database
    StoreResult<SchemaStore> store = SchemaStore::open(m_settings.dbPath);
    if (store.isError()) {
        m_err << "cdir: " << store.error().toString() << '\n';
        if (store.error().isFatal()) {
            LOG_ERROR(cdirCore, "Fatal database error, aborting: %s",
                      qUtf8Printable(store.error().toString()));
            return kExitFatal;
        }
        return kExitFailure;
    }

    ShortcutRegistry shortcuts(store.value());
    PathIndex paths(store.value(), shortcuts, m_settings);
    ImportExport importExport(paths, shortcuts);
    Context ctx{store.value(), paths, shortcuts, importExport};

    const int status = dispatch(command, positional, ctx);
    m_out.flush();
    m_err.flush();
    return status;
}

int CliApp::dispatch(const QString& command, const QStringList& args, Context& ctx)
{
    if (command == QLatin1String("add-path")) {
        return addPath(args, ctx);
    }
    if (command == QLatin1String("delete-path")) {
        return deletePath(args, ctx);
    }
    if (command == QLatin1String("paths")) {
        return listPaths(args, ctx);
    }
    if (command == QLatin1String("lasts")) {
        return lasts(ctx);
    }
    if (command == QLatin1String("history")) {
        return history(args, ctx);
    }
    if (command == QLatin1String("suggest")) {
        return suggest(args, ctx);
    }
    if (command == QLatin1String("add-shortcut")) {
        return addShortcut(args, ctx);
    }
    if (command == QLatin1String("delete-shortcut")) {
        return deleteShortcut(args, ctx);
    }
    if (command == QLatin1String("print-shortcut")) {
        return printShortcut(args, ctx);
    }
    if (command == QLatin1String("shortcuts")) {
        return listShortcuts(args, ctx);
    }
    if (command == QLatin1String("pretty-print")) {
        return prettyPrint(args, ctx);
    }
    if (command == QLatin1String("import-paths") || command == QLatin1String("import-shortcuts")) {
        return importFile(command, args, ctx);
    }
    if (command == QLatin1String("export-paths") || command == QLatin1String("export-shortcuts")) {
        return exportFile(command, args, ctx);
    }
    return usageError(QStringLiteral("unknown command '%1'").arg(command));
}

// ── Paths ───────────────────────────────────────────────────

int CliApp::addPath(const QStringList& args, Context& ctx)
{
    if (args.size() != 1) {
        return usageError(QStringLiteral("add-path expects one directory"));
    }
    const StoreStatus status = m_date >= 0 ? ctx.paths.addPath(args.first(), m_date)
                                           : ctx.paths.addPath(args.first());
    if (!status) {
        m_err << "cdir: " << status.error().toString() << '\n';
        return kExitFailure;
    }
    return kExitOk;
}

int CliApp::deletePath(const QStringList& args, Context& ctx)
{
    bool ok = false;
    const qlonglong id = args.size() == 1 ? args.first().toLongLong(&ok) : 0;
    if (!ok) {
        return usageError(QStringLiteral("delete-path expects a numeric id"));
    }
    const StoreStatus status = ctx.paths.deletePath(id);
    if (!status) {
        m_err << "cdir: " << status.error().toString() << '\n';
        return kExitFailure;
    }
    return kExitOk;
}

int CliApp::listPaths(const QStringList& args, Context& ctx)
{
    const QString filter = args.join(QLatin1Char(' '));
    const StoreResult<std::vector<PathEntry>> rows = ctx.paths.listPaths(
        static_cast<std::size_t>(m_offset), static_cast<std::size_t>(m_limit), filter, m_fuzzy);
    if (rows.isError()) {
        m_err << "cdir: " << rows.error().toString() << '\n';
        return kExitFailure;
    }
    for (const PathEntry& entry : rows.value()) {
        m_out << entry.id << '\t' << formatDate(entry.timestamp) << '\t' << entry.path;
        if (entry.shortcut) {
            m_out << "\t[" << entry.shortcut->name << ']';
        }
        if (entry.isPredicted) {
            m_out << "\t(predicted)";
        }
        m_out << '\n';
    }
    return kExitOk;
}

int CliApp::lasts(Context& ctx)
{
    const StoreResult<std::vector<PathEntry>> rows = ctx.paths.listPaths(
        0, static_cast<std::size_t>(m_limit), QString(), false);
    if (rows.isError()) {
        m_err << "cdir: " << rows.error().toString() << '\n';
        return kExitFailure;
    }
    for (const PathEntry& entry : rows.value()) {
        m_out << formatDate(entry.timestamp) << ' ' << entry.path << '\n';
    }
    return kExitOk;
}

int CliApp::history(const QStringList& args, Context& ctx)
{
    const StoreResult<std::vector<PathEntry>> rows = ctx.paths.listPathHistory(
        static_cast<std::size_t>(m_offset), static_cast<std::size_t>(m_limit),
        args.join(QLatin1Char(' ')));
    if (rows.isError()) {
        m_err << "cdir: " << rows.error().toString() << '\n';
        return kExitFailure;
    }
    for (const PathEntry& entry : rows.value()) {
        m_out << formatDate(entry.timestamp) << ' ' << entry.path << '\n';
    }
    return kExitOk;
}

int CliApp::suggest(const QStringList& args, Context& ctx)
{
    if (args.size() > 1) {
        return usageError(QStringLiteral("suggest expects at most one directory"));
    }

    const StoreResult<std::vector<ShortcutEntry>> shortcuts = ctx.shortcuts.listAllShortcuts();
    if (shortcuts.isError()) {
        m_err << "cdir: " << shortcuts.error().toString() << '\n';
        return kExitFailure;
    }

    SmartSuggester suggester(ctx.store, m_settings.homeDirectory);
    QString anchor = args.isEmpty() ? m_settings.currentDirectory : args.first();
    if (anchor.isEmpty()) {
        const StoreResult<QString> latest = suggester.latestHistoryPath();
        if (latest.isError()) {
            m_err << "cdir: " << latest.error().toString() << '\n';
            return kExitFailure;
        }
        anchor = latest.value();
    }

    const StoreResult<std::vector<PathEntry>> rows = suggester.suggest(
        anchor, m_settings.smartSuggestionsDepth, m_settings.smartSuggestionsCount,
        shortcuts.value());
    if (rows.isError()) {
        m_err << "cdir: " << rows.error().toString() << '\n';
        return kExitFailure;
    }
    for (const PathEntry& entry : rows.value()) {
        m_out << entry.path << '\n';
    }
    return kExitOk;
}

// ── Shortcuts ───────────────────────────────────────────────

int CliApp::addShortcut(const QStringList& args, Context& ctx)
{
    if (args.size() < 2) {
        return usageError(QStringLiteral("add-shortcut expects a name and a directory"));
    }
    std::optional<QString> description;
    if (args.size() > 2) {
        description = args.mid(2).join(QLatin1Char(' '));
    }
    const StoreStatus status = ctx.shortcuts.addShortcut(args.at(0), args.at(1), description);
    if (!status) {
        m_err << "cdir: " << status.error().toString() << '\n';
        return kExitFailure;
    }
    return kExitOk;
}

int CliApp::deleteShortcut(const QStringList& args, Context& ctx)
{
    if (args.size() != 1) {
        return usageError(QStringLiteral("delete-shortcut expects a name"));
    }
    const StoreStatus status = ctx.shortcuts.deleteShortcut(args.first());
    if (!status) {
        m_err << "cdir: " << status.error().toString() << '\n';
        return kExitFailure;
    }
    return kExitOk;
}

int CliApp::printShortcut(const QStringList& args, Context& ctx)
{
    if (args.size() != 1) {
        return usageError(QStringLiteral("print-shortcut expects a name"));
    }
    const StoreResult<std::optional<ShortcutEntry>> found = ctx.shortcuts.findShortcut(args.first());
    if (found.isError()) {
        m_err << "cdir: " << found.error().toString() << '\n';
        return kExitFailure;
    }
    if (!found.value()) {
        m_err << "cdir: no shortcut named '" << args.first() << "'\n";
        return kExitFailure;
    }
    m_out << found.value()->path << '\n';
    return kExitOk;
}

int CliApp::listShortcuts(const QStringList& args, Context& ctx)
{
    const StoreResult<std::vector<ShortcutEntry>> rows = ctx.shortcuts.listShortcuts(
        static_cast<std::size_t>(m_offset), static_cast<std::size_t>(m_limit),
        args.join(QLatin1Char(' ')), m_fuzzy);
    if (rows.isError()) {
        m_err << "cdir: " << rows.error().toString() << '\n';
        return kExitFailure;
    }
    for (const ShortcutEntry& entry : rows.value()) {
        m_out << entry.name << '\t' << entry.path;
        if (entry.description) {
            m_out << '\t' << *entry.description;
        }
        m_out << '\n';
    }
    return kExitOk;
}

int CliApp::prettyPrint(const QStringList& args, Context& ctx)
{
    if (args.size() != 1) {
        return usageError(QStringLiteral("pretty-print expects one directory"));
    }
    const StoreResult<std::vector<ShortcutEntry>> shortcuts = ctx.shortcuts.listAllShortcuts();
    if (shortcuts.isError()) {
        m_err << "cdir: " << shortcuts.error().toString() << '\n';
        return kExitFailure;
    }

    const int width = m_maxWidth >= 0 ? m_maxWidth : std::numeric_limits<int>::max();
    const PathShortener shortener(m_settings.homeDirectory);
    m_out << shortener.prettyPrint(args.first(), shortcuts.value(), width);
    return kExitOk;
}

// ── Import / export ─────────────────────────────────────────

int CliApp::importFile(const QString& command, const QStringList& args, Context& ctx)
{
    if (args.size() != 1) {
        return usageError(QStringLiteral("%1 expects one file").arg(command));
    }
    const std::optional<ImportReport> report = command == QLatin1String("import-paths")
        ? ctx.importExport.importPathsFile(args.first())
        : ctx.importExport.importShortcutsFile(args.first());
    if (!report) {
        m_err << "cdir: cannot import " << args.first() << '\n';
        return kExitFailure;
    }
    m_out << "imported " << report->imported << ", skipped " << report->skipped << '\n';
    return kExitOk;
}

int CliApp::exportFile(const QString& command, const QStringList& args, Context& ctx)
{
    if (args.size() != 1) {
        return usageError(QStringLiteral("%1 expects one file").arg(command));
    }
    const bool written = command == QLatin1String("export-paths")
        ? ctx.importExport.exportPaths(args.first())
        : ctx.importExport.exportShortcuts(args.first());
    if (!written) {
        m_err << "cdir: cannot write " << args.first() << '\n';
        return kExitFailure;
    }
    return kExitOk;
}

// ── Helpers ─────────────────────────────────────────────────

int CliApp::usageError(const QString& message)
{
    m_err << "cdir: " << message << "\nTry 'cdir --help'.\n";
    m_err.flush();
    return kExitFailure;
}

QString CliApp::formatDate(int64_t timestamp) const
{
    return QDateTime::fromSecsSinceEpoch(timestamp).toString(m_settings.dateFormat);
}

} // namespace cdir
