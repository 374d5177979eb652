#include <QtTest/QtTest>
#include "core/embedding/embedding_input.h"

namespace ei = ss::embedding_input;

class TestEmbeddingInput : public QObject {
    Q_OBJECT

private slots:
    void testEstimateTokens();
    void testEstimateTokensCoercesVariants();
    void testTokenLimitAppliesHeadroom();
    void testTokenLimitDefaultContext();
    void testTruncateToTokenLimit();
    void testTruncateKeepsShortText();
    void testTruncateDoesNotSplitSurrogatePair();
    void testCapEmbeddingInput();
    void testCapIsIdempotent();
};

void TestEmbeddingInput::testEstimateTokens()
{
    QCOMPARE(ei::estimateTokens(QStringLiteral("abcd")), 2);      // ceil(4 / 3.5)
    QCOMPARE(ei::estimateTokens(QStringLiteral("abcdefg")), 2);   // exactly 7 / 3.5
    QCOMPARE(ei::estimateTokens(QStringLiteral("abcdefgh")), 3);
    QCOMPARE(ei::estimateTokens(QString()), 0);
    QCOMPARE(ei::estimateTokens(QStringLiteral("abcd"), 2.0), 2);
    // Invalid ratio falls back to the default
    QCOMPARE(ei::estimateTokens(QStringLiteral("abcd"), 0.0), 2);
}

void TestEmbeddingInput::testEstimateTokensCoercesVariants()
{
    QCOMPARE(ei::estimateTokens(QVariant(1234567)), 2);   // "1234567"
    QCOMPARE(ei::estimateTokens(QVariant(QStringLiteral("abcd"))), 2);
    QCOMPARE(ei::estimateTokens(QVariant()), 0);
}

void TestEmbeddingInput::testTokenLimitAppliesHeadroom()
{
    QCOMPARE(ei::embeddingTokenLimit(100), 85);
    QCOMPARE(ei::embeddingTokenLimit(2048), 1740);
    // Floor of 32 tokens
    QCOMPARE(ei::embeddingTokenLimit(10), 32);
    QCOMPARE(ei::embeddingTokenLimit(1), 32);
}

void TestEmbeddingInput::testTokenLimitDefaultContext()
{
    QCOMPARE(ei::embeddingTokenLimit(), 850);   // floor(1000 * 0.85)
    QCOMPARE(ei::embeddingTokenLimit(std::nullopt), 850);
    QCOMPARE(ei::embeddingTokenLimit(0), 850);
}

void TestEmbeddingInput::testTruncateToTokenLimit()
{
    const auto result = ei::truncateToTokenLimit(QStringLiteral("abcdefghij"), 2, 2.0);
    QVERIFY(result.wasTruncated);
    QCOMPARE(result.text, QStringLiteral("abcd"));
    QCOMPARE(result.maxChars, 4);
}

void TestEmbeddingInput::testTruncateKeepsShortText()
{
    const auto result = ei::truncateToTokenLimit(QStringLiteral("abc"), 2, 2.0);
    QVERIFY(!result.wasTruncated);
    QCOMPARE(result.text, QStringLiteral("abc"));
    QCOMPARE(result.maxChars, 4);
}

void TestEmbeddingInput::testTruncateDoesNotSplitSurrogatePair()
{
    // "abc" + U+1F600: the cut at 4 code units would leave a lone high surrogate
    const QString text = QStringLiteral("abc") + QString::fromUcs4(U"\U0001F600") + QStringLiteral("xyz");
    const auto result = ei::truncateToTokenLimit(text, 2, 2.0);
    QVERIFY(result.wasTruncated);
    QCOMPARE(result.text, QStringLiteral("abc"));
    QVERIFY(!result.text.back().isHighSurrogate());
}

void TestEmbeddingInput::testCapEmbeddingInput()
{
    ei::CapOptions options;
    options.maxTokens = 2;
    options.charsPerToken = 2.0;
    const auto capped = ei::capEmbeddingInput(QString(100, QLatin1Char('a')), options);

    QVERIFY(capped.wasTruncated);
    QCOMPARE(capped.maxTokens, 32);        // headroom floor
    QCOMPARE(capped.text.size(), 64);      // 32 tokens * 2 chars
    QCOMPARE(capped.estimatedTokens, 50);  // measured before truncation
}

void TestEmbeddingInput::testCapIsIdempotent()
{
    ei::CapOptions options;
    options.maxTokens = 40;
    const auto first = ei::capEmbeddingInput(QString(500, QLatin1Char('z')), options);
    QVERIFY(first.wasTruncated);

    const auto second = ei::capEmbeddingInput(first.text, options);
    QVERIFY(!second.wasTruncated);
    QCOMPARE(second.text, first.text);
}

QTEST_MAIN(TestEmbeddingInput)
#include "test_embedding_input.moc"
