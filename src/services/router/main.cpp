#include "router_cli.h"

#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include <cstdio>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("helmquery"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Route maritime maintenance queries to a handling lane."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringLiteral("config"),
        QStringLiteral("Router settings JSON file."),
        QStringLiteral("file"));
    const QCommandLineOption prettyOption(
        QStringLiteral("pretty"),
        QStringLiteral("Indent JSON output."));
    parser.addOption(configOption);
    parser.addOption(prettyOption);
    parser.addPositionalArgument(QStringLiteral("query"),
                                 QStringLiteral("Queries to classify; stdin lines when omitted."),
                                 QStringLiteral("[query...]"));
    parser.process(app);

    hq::RouterSettings settings;
    const QString configPath = parser.isSet(configOption)
        ? parser.value(configOption)
        : hq::SettingsManager::settingsFilePath();
    if (const auto loaded = hq::SettingsManager::load(configPath)) {
        settings = *loaded;
    } else if (parser.isSet(configOption)) {
        LOG_ERROR(hqCore, "Cannot load settings from %s", qUtf8Printable(configPath));
        return 1;
    }

    const hq::RouterCli cli(settings, parser.isSet(prettyOption));
    QTextStream out(stdout);

    const QStringList queries = parser.positionalArguments();
    if (!queries.isEmpty()) {
        return cli.run(queries, out);
    }

    QTextStream in(stdin);
    return cli.runStream(in, out);
}
