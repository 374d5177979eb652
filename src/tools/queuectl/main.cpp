#include "tools/queuectl/queue_control.h"
#include "core/shared/settings_manager.h"
#include "core/shared/types.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QTextStream>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("stratosort-queuectl"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Inspect and repair persisted StratoSort stage queues."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dataDirOption(
        QStringLiteral("data-dir"),
        QStringLiteral("Directory holding the queue files (default: settings data dir)."),
        QStringLiteral("dir"));
    const QCommandLineOption stageOption(
        QStringLiteral("stage"), QStringLiteral("Stage name (default: embedding)."),
        QStringLiteral("name"), QStringLiteral("embedding"));
    const QCommandLineOption backendOption(
        QStringLiteral("backend"), QStringLiteral("Queue storage backend: json or sqlite."),
        QStringLiteral("backend"));
    const QCommandLineOption listDeadOption(
        QStringLiteral("list-dead"), QStringLiteral("Print dead-lettered jobs."));
    const QCommandLineOption retryDeadOption(
        QStringLiteral("retry-dead"), QStringLiteral("Move a dead-lettered job back to pending."),
        QStringLiteral("id"));
    const QCommandLineOption clearDeadOption(
        QStringLiteral("clear-dead"), QStringLiteral("Discard all dead-lettered jobs."));

    parser.addOption(dataDirOption);
    parser.addOption(stageOption);
    parser.addOption(backendOption);
    parser.addOption(listDeadOption);
    parser.addOption(retryDeadOption);
    parser.addOption(clearDeadOption);
    parser.process(app);

    const ss::PipelineSettings settings =
        ss::SettingsManager::load().value_or(ss::PipelineSettings{});

    ss::QueueControlRequest request;
    request.stage = parser.value(stageOption);
    request.dataDir = parser.value(dataDirOption);
    if (parser.isSet(backendOption)) {
        request.backend = ss::queueBackendFromString(parser.value(backendOption));
    }
    request.listDead = parser.isSet(listDeadOption);
    request.retryJobId = parser.value(retryDeadOption);
    request.clearDead = parser.isSet(clearDeadOption);

    ss::StageQueue queue(ss::queueControlConfig(settings, request));
    const ss::QueueControlResult result = ss::runQueueControl(queue, request);

    if (!result.error.isEmpty()) {
        QTextStream(stderr) << result.error << "\n";
    }
    QTextStream(stdout) << QJsonDocument(result.report).toJson(QJsonDocument::Indented);
    return result.exitCode;
}
