#include <gtest/gtest.h>
#include <QSignalSpy>
#include <QTest>
#include <QTimer>

#include "SearchResult.h"

static SsdpDatagram rootDeviceReply()
{
    return SsdpDatagram::fromByteArray("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n");
}

TEST(SearchResultTest, FirstResolutionWins)
{
    SearchResult result;
    QSignalSpy spy(&result, &SearchResult::finished);

    EXPECT_TRUE(result.resolve(rootDeviceReply()));
    EXPECT_FALSE(result.resolve(SsdpDatagram(SsdpDatagram::OkReply)));
    EXPECT_FALSE(result.cancel(Ssdp::Error::TimeoutError));

    EXPECT_EQ(spy.count(), 1);
    EXPECT_TRUE(result.isFinished());
    EXPECT_EQ(result.error(), Ssdp::Error::NoError);
    EXPECT_EQ(result.reply().st(), QString("upnp:rootdevice"));
}

TEST(SearchResultTest, TimeoutCancels)
{
    SearchResult result;
    QSignalSpy spy(&result, &SearchResult::finished);

    result.startTimeout(20);
    ASSERT_TRUE(spy.wait(1000));

    EXPECT_EQ(result.error(), Ssdp::Error::TimeoutError);
    EXPECT_TRUE(result.reply().isNull());
    EXPECT_FALSE(result.resolve(rootDeviceReply()));
    EXPECT_EQ(spy.count(), 1);
}

TEST(SearchResultTest, ResolveStopsEveryTimeout)
{
    SearchResult result;
    QTimer *first = result.startTimeout(30);
    QTimer *second = result.startTimeout(30);

    result.resolve(rootDeviceReply());

    EXPECT_FALSE(first->isActive());
    EXPECT_FALSE(second->isActive());
}

TEST(SearchResultTest, TimeoutRacingReplyRecordsOnlyOne)
{
    SearchResult result;
    QSignalSpy spy(&result, &SearchResult::finished);
    result.startTimeout(0);
    // both are due in the same loop iteration; whichever runs first decides
    QTimer::singleShot(0, &result, [&result]() {
        result.resolve(rootDeviceReply());
    });

    ASSERT_TRUE(spy.wait(1000));
    QTest::qWait(20);

    EXPECT_EQ(spy.count(), 1);
    if (result.error() == Ssdp::Error::NoError)
        EXPECT_FALSE(result.reply().isNull());
    else
        EXPECT_TRUE(result.reply().isNull());
}

TEST(SearchResultTest, AbortReportsCancellation)
{
    SearchResult result;
    QTimer *timer = result.startTimeout(1000);

    result.abort();

    EXPECT_FALSE(timer->isActive());
    EXPECT_EQ(result.error(), Ssdp::Error::OperationCanceledError);
}

TEST(SearchResultTest, FailLaterEmitsFromEventLoop)
{
    SearchResult result;
    QSignalSpy spy(&result, &SearchResult::finished);

    result.failLater(Ssdp::Error::InvalidRequestError);

    EXPECT_TRUE(result.isFinished());
    EXPECT_EQ(spy.count(), 0);
    ASSERT_TRUE(spy.wait(1000));
    EXPECT_EQ(result.error(), Ssdp::Error::InvalidRequestError);
}
