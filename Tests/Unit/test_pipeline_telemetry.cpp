#include <QtTest/QtTest>
#include "core/indexing/pipeline_telemetry.h"

#include <thread>
#include <vector>

class TestPipelineTelemetry : public QObject {
    Q_OBJECT

private slots:
    void testEmptySnapshot()
    {
        ss::PipelineTelemetry telemetry;
        const QJsonObject snapshot = telemetry.snapshot();
        QCOMPARE(snapshot.value(QStringLiteral("filesIndexed")).toInt(), 0);
        QCOMPARE(snapshot.value(QStringLiteral("cacheHitRate")).toDouble(), 0.0);
        QCOMPARE(snapshot.value(QStringLiteral("embedLatencyAvgMs")).toDouble(), 0.0);
    }

    void testCountersAndRates()
    {
        ss::PipelineTelemetry telemetry;
        telemetry.recordFileIndexed(4, 1);
        telemetry.recordCacheLookup(true);
        telemetry.recordCacheLookup(false);
        telemetry.recordCacheLookup(false);
        telemetry.recordCacheLookup(true);
        telemetry.recordEmbeddingStored(10);
        telemetry.recordEmbeddingStored(30);
        telemetry.recordMoveBatch(3, 1, false);
        telemetry.recordMoveBatch(0, 0, true);
        telemetry.recordWatcherEvent(true);
        telemetry.recordWatcherEvent(false);
        telemetry.recordCategorization(false);

        const QJsonObject snapshot = telemetry.snapshot();
        QCOMPARE(snapshot.value(QStringLiteral("chunksPrepared")).toInt(), 4);
        QCOMPARE(snapshot.value(QStringLiteral("chunksTruncated")).toInt(), 1);
        QCOMPARE(snapshot.value(QStringLiteral("cacheHitRate")).toDouble(), 0.5);
        QCOMPARE(snapshot.value(QStringLiteral("embedLatencyAvgMs")).toDouble(), 20.0);
        QCOMPARE(snapshot.value(QStringLiteral("embedLatencyMaxMs")).toInt(), 30);
        QCOMPARE(snapshot.value(QStringLiteral("filesMoved")).toInt(), 3);
        QCOMPARE(snapshot.value(QStringLiteral("moveFailures")).toInt(), 1);
        QCOMPARE(snapshot.value(QStringLiteral("lockTimeouts")).toInt(), 1);
        QCOMPARE(snapshot.value(QStringLiteral("watcherEventsSeen")).toInt(), 2);
        QCOMPARE(snapshot.value(QStringLiteral("watcherEventsSuppressed")).toInt(), 1);
        QCOMPARE(snapshot.value(QStringLiteral("categorizationFailures")).toInt(), 1);

        telemetry.reset();
        QCOMPARE(telemetry.snapshot().value(QStringLiteral("filesMoved")).toInt(), 0);
        QCOMPARE(telemetry.snapshot().value(QStringLiteral("embedLatencyMaxMs")).toInt(), 0);
    }

    void testConcurrentRecording()
    {
        ss::PipelineTelemetry telemetry;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&telemetry, t] {
                for (int i = 0; i < 1000; ++i) {
                    telemetry.recordEmbeddingStored(t * 1000 + i);
                    telemetry.recordDeadLetter();
                }
            });
        }
        for (std::thread& thread : threads) {
            thread.join();
        }

        const QJsonObject snapshot = telemetry.snapshot();
        QCOMPARE(snapshot.value(QStringLiteral("embeddingsStored")).toInt(), 4000);
        QCOMPARE(snapshot.value(QStringLiteral("deadLettered")).toInt(), 4000);
        QCOMPARE(snapshot.value(QStringLiteral("embedLatencyMaxMs")).toInt(), 3999);
    }
};

QTEST_MAIN(TestPipelineTelemetry)
#include "test_pipeline_telemetry.moc"
