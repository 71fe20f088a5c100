#include <thread>
#include <atomic>
#include <tuple>
#include <chrono>
#include <vector>
#include <string>
#include <memory>
#include <optional>

#include <gtest/gtest.h>

#include "debug.hpp"
#include "notifier.hpp"
#include "chan.hpp"


using namespace chanx;
using namespace std::chrono_literals;


TEST(ChanTest, BufferedSendRecv) {
    Chan<int> ch(3);
    EXPECT_EQ(ch.Cap(), 3u);
    EXPECT_TRUE(ch.Send(1));
    EXPECT_TRUE(ch.Send(2));
    EXPECT_EQ(ch.Len(), 2u);
    EXPECT_EQ(ch.Recv(), 1);
    EXPECT_EQ(ch.Recv(), 2);
    EXPECT_EQ(ch.Len(), 0u);
}

TEST(ChanTest, BufferedTrySendBlocksWhenFull) {
    Chan<int> ch(2);
    int v = 1;
    EXPECT_EQ(ch.TrySend(v), CHAN_OK);
    v = 2;
    EXPECT_EQ(ch.TrySend(v), CHAN_OK);
    v = 3;
    EXPECT_EQ(ch.TrySend(v), CHAN_BLOCKED);
    EXPECT_EQ(v, 3);

    int got = 0;
    EXPECT_EQ(ch.TryRecv(got), CHAN_OK);
    EXPECT_EQ(got, 1);
    EXPECT_EQ(ch.TrySend(v), CHAN_OK);
    EXPECT_EQ(ch.Len(), 2u);
}

TEST(ChanTest, TryRecvOnEmpty) {
    Chan<int> ch(1);
    int got = -1;
    EXPECT_EQ(ch.TryRecv(got), CHAN_BLOCKED);
    EXPECT_EQ(got, -1);
}

TEST(ChanTest, SendForTimesOutWhenFull) {
    Chan<std::string> ch(1);
    std::string v = "first";
    EXPECT_EQ(ch.SendFor(v, 10ms), CHAN_OK);
    v = "second";
    EXPECT_EQ(ch.SendFor(v, 20ms), CHAN_BLOCKED);
    EXPECT_EQ(v, "second");
}

TEST(ChanTest, RecvForTimesOutWhenEmpty) {
    Chan<int> ch(1);
    int got = -1;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(ch.RecvFor(got, 20ms), CHAN_BLOCKED);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
    EXPECT_EQ(got, -1);
}

TEST(ChanTest, BlockedSenderResumes) {
    Chan<int> ch(1);
    ASSERT_TRUE(ch.Send(1));
    std::thread sender([&]() { EXPECT_TRUE(ch.Send(2)); });

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(ch.Recv(), 1);
    EXPECT_EQ(ch.Recv(), 2);
    sender.join();
}


TEST(ChanTest, ArmedReceiverAcceptsTrySend) {
    Chan<int> ch(0);
    int v = 3;
    ch.ArmReceiver();
    EXPECT_EQ(ch.TrySend(v), CHAN_OK);
    // one armed receiver is matched with one value only
    v = 4;
    EXPECT_EQ(ch.TrySend(v), CHAN_BLOCKED);
    ch.DisarmReceiver();

    int got = 0;
    EXPECT_EQ(ch.TryRecv(got), CHAN_OK);
    EXPECT_EQ(got, 3);
    EXPECT_EQ(ch.TrySend(v), CHAN_BLOCKED);
}

TEST(ChanTest, UnbufferedTrySendNeedsReceiver) {
    Chan<int> ch(0);
    int v = 7;
    EXPECT_EQ(ch.TrySend(v), CHAN_BLOCKED);

    std::optional<int> got;
    std::thread receiver([&]() { got = ch.Recv(); });
    // keep trying until the receiver is parked in Recv()
    while (ch.TrySend(v) != CHAN_OK)
        std::this_thread::sleep_for(1ms);
    receiver.join();
    EXPECT_EQ(got, 7);
}

TEST(ChanTest, UnbufferedSendWaitsForReceiver) {
    Chan<int> ch(0);
    std::atomic<bool> sent = false;
    std::thread sender([&]() {
        EXPECT_TRUE(ch.Send(42));
        sent = true;
    });

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(sent.load());
    EXPECT_EQ(ch.Recv(), 42);
    sender.join();
    EXPECT_TRUE(sent.load());
}

TEST(ChanTest, UnbufferedTryRecvTakesOffer) {
    Chan<int> ch(0);
    std::thread sender([&]() { EXPECT_TRUE(ch.Send(5)); });

    int got = 0;
    while (ch.TryRecv(got) != CHAN_OK)
        std::this_thread::sleep_for(1ms);
    EXPECT_EQ(got, 5);
    sender.join();
}

TEST(ChanTest, UnbufferedSendForWithdraws) {
    Chan<std::string> ch(0);
    std::string v = "value";
    EXPECT_EQ(ch.SendFor(v, 10ms), CHAN_BLOCKED);
    EXPECT_EQ(v, "value");

    // nothing left behind once the offer was withdrawn
    std::string got;
    EXPECT_EQ(ch.TryRecv(got), CHAN_BLOCKED);
}

TEST(ChanTest, UnbufferedOrderOfSenders) {
    Chan<int> ch(0);
    std::vector<int> got;
    std::thread receiver([&]() {
        while (auto v = ch.Recv())
            got.push_back(*v);
    });
    for (int i = 0; i < 100; ++i)
        ASSERT_TRUE(ch.Send(i));
    ch.Close();
    receiver.join();

    ASSERT_EQ(got.size(), 100u);
    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(got[i], i);
}


TEST(ChanTest, CloseIsIdempotent) {
    Chan<int> ch(1);
    EXPECT_FALSE(ch.IsClosed());
    EXPECT_TRUE(ch.Close());
    EXPECT_FALSE(ch.Close());
    EXPECT_TRUE(ch.IsClosed());
}

TEST(ChanTest, SendAfterClose) {
    Chan<int> ch(1);
    ch.Close();
    EXPECT_FALSE(ch.Send(1));
    int v = 1;
    EXPECT_EQ(ch.TrySend(v), CHAN_CLOSED);
    EXPECT_EQ(ch.SendFor(v, 10ms), CHAN_CLOSED);
}

TEST(ChanTest, DrainAfterClose) {
    Chan<int> ch(3);
    ch.Send(1);
    ch.Send(2);
    ch.Close();

    EXPECT_EQ(ch.Recv(), 1);
    int got = 0;
    EXPECT_EQ(ch.TryRecv(got), CHAN_OK);
    EXPECT_EQ(got, 2);
    EXPECT_EQ(ch.Recv(), std::nullopt);
    EXPECT_EQ(ch.TryRecv(got), CHAN_CLOSED);
    EXPECT_EQ(ch.RecvFor(got, 10ms), CHAN_CLOSED);
}

TEST(ChanTest, CloseWakesReceiver) {
    Chan<int> ch(0);
    std::thread receiver([&]() { EXPECT_EQ(ch.Recv(), std::nullopt); });
    std::this_thread::sleep_for(20ms);
    ch.Close();
    receiver.join();
}

TEST(ChanTest, CloseFailsBlockedUnbufferedSender) {
    Chan<int> ch(0);
    std::thread sender([&]() { EXPECT_FALSE(ch.Send(1)); });
    std::this_thread::sleep_for(20ms);
    ch.Close();
    sender.join();

    // the withdrawn offer is not delivered
    EXPECT_EQ(ch.Recv(), std::nullopt);
}

TEST(ChanTest, CloseFailsBlockedBufferedSender) {
    Chan<int> ch(1);
    ch.Send(1);
    std::thread sender([&]() { EXPECT_FALSE(ch.Send(2)); });
    std::this_thread::sleep_for(20ms);
    ch.Close();
    sender.join();

    EXPECT_EQ(ch.Recv(), 1);
    EXPECT_EQ(ch.Recv(), std::nullopt);
}

TEST(ChanTest, StreamDump) {
    Chan<int> ch(4);
    ch.Send(1);
    ch.Close();
    EXPECT_EQ(StreamStr(ch), "chan[1/4,o0,w0,closed]");
    EXPECT_EQ(StreamStr(CHAN_BLOCKED), "blocked");
}


TEST(ChanTest, MakeChanEndpoints) {
    auto ping = MakeChan<int>(0);
    auto pong = MakeChan<int>(0);
    Sender<int> ping_tx = std::get<0>(ping);
    Receiver<int> ping_rx = std::get<1>(ping);
    Sender<int> pong_tx = std::get<0>(pong);
    Receiver<int> pong_rx = std::get<1>(pong);

    std::thread echo([ping_rx, pong_tx]() mutable {
        while (auto v = ping_rx.Recv())
            pong_tx.Send(*v + 1);
        pong_tx.Close();
    });

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(ping_tx.Send(i));
        EXPECT_EQ(pong_rx.Recv(), i + 1);
    }
    ping_tx.Close();
    EXPECT_EQ(pong_rx.Recv(), std::nullopt);
    echo.join();
    EXPECT_TRUE(pong_rx.IsClosed());
}


TEST(NotifierTest, WaitChangeReturnsOnNotify) {
    Notifier n;
    uint64_t seen = n.Epoch();
    std::thread waker([&]() {
        std::this_thread::sleep_for(10ms);
        n.Notify();
    });
    n.WaitChange(seen);
    EXPECT_NE(n.Epoch(), seen);
    waker.join();
}

TEST(NotifierTest, ChangeBeforeWaitIsNotLost) {
    Notifier n;
    uint64_t seen = n.Epoch();
    n.Notify();
    // returns immediately, the epoch moved already
    n.WaitChange(seen);
    EXPECT_FALSE(n.WaitChangeUntil(n.Epoch(),
                                   std::chrono::steady_clock::now() + 10ms));
}

TEST(NotifierTest, WatchedChannelsBumpEpoch) {
    auto n = std::make_shared<Notifier>();
    Chan<int> a(1), b(1);
    a.Watch(n);
    b.Watch(n);

    uint64_t seen = n->Epoch();
    a.Send(1);
    EXPECT_GT(n->Epoch(), seen);

    seen = n->Epoch();
    int got = 0;
    EXPECT_EQ(b.TryRecv(got), CHAN_BLOCKED);
    EXPECT_EQ(n->Epoch(), seen);

    EXPECT_EQ(a.TryRecv(got), CHAN_OK);
    EXPECT_GT(n->Epoch(), seen);

    seen = n->Epoch();
    b.Close();
    EXPECT_GT(n->Epoch(), seen);
}

TEST(NotifierTest, SelectOverTwoChannels) {
    auto n = std::make_shared<Notifier>();
    Chan<int> a(0), b(0);
    a.Watch(n);
    b.Watch(n);

    std::thread sender([&]() { b.Send(9); });

    int got = 0;
    while (true) {
        uint64_t seen = n->Epoch();
        if (a.TryRecv(got) == CHAN_OK || b.TryRecv(got) == CHAN_OK)
            break;
        n->WaitChange(seen);
    }
    EXPECT_EQ(got, 9);
    sender.join();
}
