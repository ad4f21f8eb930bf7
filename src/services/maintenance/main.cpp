#include "maintenance_tool.h"

#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QTextStream>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("memctl-maintenance"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("memctl retrieval maintenance"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("rebuild-lexical | backfill | search <project> <query> | similar <id> | serve"));

    const QCommandLineOption settingsOption(
        QStringLiteral("settings"), QStringLiteral("Settings file."), QStringLiteral("path"));
    const QCommandLineOption dbOption(
        QStringLiteral("db"), QStringLiteral("Database file."), QStringLiteral("path"));
    const QCommandLineOption modelsOption(
        QStringLiteral("models"), QStringLiteral("Models directory."), QStringLiteral("dir"));
    const QCommandLineOption limitOption(
        QStringLiteral("limit"), QStringLiteral("Maximum results (default 10)."),
        QStringLiteral("n"), QStringLiteral("10"));
    parser.addOption(settingsOption);
    parser.addOption(dbOption);
    parser.addOption(modelsOption);
    parser.addOption(limitOption);
    parser.process(app);

    if (parser.isSet(settingsOption)) {
        qputenv("MEMCTL_SETTINGS_PATH", parser.value(settingsOption).toUtf8());
    }

    mc::EngineSettings settings = mc::SettingsManager::loadOrDefault();
    if (parser.isSet(dbOption)) {
        settings.dbPath = QDir::cleanPath(parser.value(dbOption));
    }
    if (parser.isSet(modelsOption)) {
        settings.modelsDir = QDir::cleanPath(parser.value(modelsOption));
    }

    bool limitOk = false;
    const int limit = parser.value(limitOption).toInt(&limitOk);
    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || !limitOk || limit <= 0) {
        parser.showHelp(1);
    }

    const QString command = args.front();
    const bool known = command == QLatin1String("rebuild-lexical")
        || command == QLatin1String("backfill")
        || command == QLatin1String("serve")
        || (command == QLatin1String("search") && args.size() >= 3)
        || (command == QLatin1String("similar") && args.size() == 2);
    if (!known) {
        QTextStream(stderr) << "unknown or incomplete command: " << args.join(QLatin1Char(' ')) << '\n';
        parser.showHelp(1);
    }

    mc::MaintenanceTool tool(settings);
    if (!tool.open()) {
        return 1;
    }

    if (command == QLatin1String("rebuild-lexical")) {
        return tool.rebuildLexical();
    }
    if (command == QLatin1String("backfill")) {
        return tool.backfill();
    }
    if (command == QLatin1String("search")) {
        return tool.search(args.at(1), args.mid(2).join(QLatin1Char(' ')), limit);
    }
    if (command == QLatin1String("similar")) {
        return tool.similar(args.at(1), limit);
    }
    return tool.serve();
}
