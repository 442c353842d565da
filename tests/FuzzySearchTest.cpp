#include <gtest/gtest.h>
#include <QSignalSpy>
#include <QTest>

#include "FakeTransport.h"
#include "FuzzySearch.h"
#include "SearchPatterns.h"

namespace {

const QHostAddress lan("192.168.1.10");
const QHostAddress gateway("192.168.1.1");

QList<SsdpSearchParams> testCandidates(int count)
{
    QList<SsdpSearchParams> candidates;
    for (int i = 0; i < count; ++i) {
        SsdpSearchParams params;
        params.append("ST", QStringLiteral("urn:test:%1").arg(i));
        candidates.append(params);
    }
    return candidates;
}

QStringList targets(std::initializer_list<int> indexes)
{
    QStringList list;
    for (int i : indexes)
        list.append(QStringLiteral("urn:test:%1").arg(i));
    return list;
}

FakeNetwork::Responder answerOnly(const QString &st)
{
    return [st](const SsdpDatagram &request) -> QList<QByteArray> {
        if (request.st() == st)
            return { okReply(st) };
        return {};
    };
}

class FuzzySearchTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config.verifyTimeout = 100;
        search = new FuzzySearch(lan, gateway, 1000, &owner);
        search->setConfig(config);
        search->setTransportFactory(network.factory());
        search->setCandidates(testCandidates(10));
    }

    bool run(int timeout = 5000)
    {
        QSignalSpy spy(search, &FuzzySearch::finished);
        search->start();
        return spy.wait(timeout);
    }

    FakeNetwork network;
    QObject owner;
    DiscoveryConfig config;
    FuzzySearch *search = nullptr;
};

}

TEST_F(FuzzySearchTest, NarrowsDownTheAnsweringBatch)
{
    network.responder = answerOnly("urn:test:5");

    ASSERT_TRUE(run());

    EXPECT_EQ(search->error(), Ssdp::Error::NoError);
    EXPECT_EQ(search->batchTimeout(), 100);
    EXPECT_EQ(search->params().st(), QString("urn:test:5"));
    EXPECT_EQ(search->reply().st(), QString("urn:test:5"));
    EXPECT_EQ(search->viableCandidates(), testCandidates(6).mid(4));
    // batches 4 and 5 never go out; 4 and 5 are then retried one at a time
    EXPECT_EQ(network.sentTargets(), targets({ 0, 1, 2, 3, 4, 5, 4, 5 }));
    EXPECT_EQ(network.created, 3);
    EXPECT_EQ(network.openTransports, 0);
}

TEST_F(FuzzySearchTest, StopsAtFirstVerifiedCandidate)
{
    network.responder = answerOnly("urn:test:4");

    ASSERT_TRUE(run());

    EXPECT_EQ(search->error(), Ssdp::Error::NoError);
    EXPECT_EQ(search->params().st(), QString("urn:test:4"));
    EXPECT_EQ(network.sentTargets(), targets({ 0, 1, 2, 3, 4, 5, 4 }));
}

TEST_F(FuzzySearchTest, AllBatchesTimingOutFails)
{
    ASSERT_TRUE(run());

    EXPECT_EQ(search->error(), Ssdp::Error::TimeoutError);
    EXPECT_EQ(search->errorString(), QString("M-SEARCH for 192.168.1.1:1900 timed out"));
    EXPECT_TRUE(search->reply().isNull());
    EXPECT_TRUE(search->params().headers.isEmpty());
    EXPECT_EQ(network.sent.size(), 10);
    EXPECT_EQ(network.created, 1);
    EXPECT_EQ(network.openTransports, 0);
}

TEST_F(FuzzySearchTest, CoincidentalBatchReplyEndsInDiscoveryFailure)
{
    bool answered = false;
    network.responder = [&answered](const SsdpDatagram &request) -> QList<QByteArray> {
        if (answered || request.st() != "urn:test:2")
            return {};
        answered = true;
        return { okReply("upnp:rootdevice") };
    };

    ASSERT_TRUE(run());

    EXPECT_EQ(search->error(), Ssdp::Error::DiscoveryFailedError);
    EXPECT_EQ(search->errorString(), QString("failed to discover gateway"));
    EXPECT_EQ(network.sentTargets(), targets({ 0, 1, 2, 3, 2, 3 }));
    EXPECT_EQ(network.openTransports, 0);
}

TEST_F(FuzzySearchTest, SetupFailureIsReported)
{
    network.failOpen = true;

    ASSERT_TRUE(run());

    EXPECT_EQ(search->error(), Ssdp::Error::TransportError);
    EXPECT_TRUE(network.sent.isEmpty());
}

TEST_F(FuzzySearchTest, ConfigurableBatchSize)
{
    config.batchSize = 3;
    search->setConfig(config);
    network.responder = answerOnly("urn:test:5");

    ASSERT_TRUE(run());

    EXPECT_EQ(search->viableCandidates(), testCandidates(6).mid(3));
    EXPECT_EQ(search->params().st(), QString("urn:test:5"));
}

TEST_F(FuzzySearchTest, AbortDuringBatchesReleasesTransport)
{
    QSignalSpy spy(search, &FuzzySearch::finished);
    search->start();
    EXPECT_EQ(network.openTransports, 1);

    search->abort();

    EXPECT_EQ(spy.count(), 1);
    EXPECT_EQ(search->error(), Ssdp::Error::OperationCanceledError);
    EXPECT_EQ(network.openTransports, 0);
    QTest::qWait(300);
    EXPECT_EQ(spy.count(), 1);
    EXPECT_EQ(network.sent.size(), 2);
}

TEST(FuzzySearchDefaultsTest, UsesGeneratedPatterns)
{
    const QList<SsdpSearchParams> patterns = SearchPatterns::generate();
    FakeNetwork network;
    network.responder = answerOnly(patterns.first().st());

    FuzzySearch search(lan, gateway);
    search.setTransportFactory(network.factory());
    QSignalSpy spy(&search, &FuzzySearch::finished);
    search.start();

    ASSERT_TRUE(spy.wait(5000));
    EXPECT_EQ(search.error(), Ssdp::Error::NoError);
    EXPECT_EQ(search.batchTimeout(), 30000 / patterns.size());
    EXPECT_EQ(search.params(), patterns.first());
}
