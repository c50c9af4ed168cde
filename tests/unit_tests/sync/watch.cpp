#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include "sync/watch.hpp"
#include "sync/latch.hpp"

class WatchTest : public ::testing::Test
{
};

// получатель видит начальное значение
TEST_F(WatchTest, ReceiverSeesInitialValue)
{
    auto [sender, receiver] = make_watch_channel<int>(7);
    EXPECT_EQ(receiver.get(), 7);
}

// последнее значение побеждает, промежуточные пропускаются
TEST_F(WatchTest, LastValueWins)
{
    auto [sender, receiver] = make_watch_channel<int>(0);
    sender.send(1);
    sender.send(2);
    sender.send(3);
    EXPECT_EQ(receiver.get(), 3);
}

// get_if_new отдает значение один раз
TEST_F(WatchTest, GetIfNewReturnsEachValueOnce)
{
    auto [sender, receiver] = make_watch_channel<std::string>("first");
    auto seen = receiver.get_if_new();
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(*seen, "first");
    EXPECT_FALSE(receiver.get_if_new().has_value());

    sender.send("second");
    seen = receiver.get_if_new();
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(*seen, "second");
    EXPECT_FALSE(receiver.get_if_new().has_value());
}

// get не отмечает значение как увиденное
TEST_F(WatchTest, GetDoesNotConsume)
{
    auto [sender, receiver] = make_watch_channel<int>(1);
    EXPECT_EQ(receiver.get(), 1);
    EXPECT_TRUE(receiver.get_if_new().has_value());
}

// у каждого получателя свой учет увиденного
TEST_F(WatchTest, ReceiversTrackIndependently)
{
    auto [sender, first] = make_watch_channel<int>(0);
    auto second = sender.subscribe();
    sender.send(5);
    EXPECT_EQ(first.get_if_new(), 5);
    EXPECT_EQ(second.get_if_new(), 5);
    EXPECT_FALSE(first.get_if_new().has_value());
}

// повторная отправка того же значения - снова новое значение
TEST_F(WatchTest, ResendingSameValueIsNew)
{
    auto [sender, receiver] = make_watch_channel<int>(4);
    receiver.get_if_new();
    sender.send(4);
    EXPECT_EQ(receiver.get_if_new(), 4);
}

struct Pair_snapshot
{
    int a = 0;
    int b = 0;
};

// читатель никогда не видит поля из разных снимков
TEST_F(WatchTest, SnapshotsAreAtomic)
{
    auto [sender, receiver] = make_watch_channel<Pair_snapshot>({});
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::thread reader([&, receiver = receiver]()
    {
        while(!done)
        {
            auto value = receiver.get();
            if(value.a != value.b)
                ++torn;
        }
    });
    for(int i = 0; i < 100000; ++i)
        sender.send({i, i});
    done = true;
    reader.join();
    EXPECT_EQ(torn.load(), 0);
}

class LatchTest : public ::testing::Test
{
};

// флаг изначально выключен
TEST_F(LatchTest, StartsInactive)
{
    Latch latch;
    auto monitor = latch.watch();
    EXPECT_FALSE(latch.active());
    EXPECT_FALSE(monitor.active());
}

// on, off, toggle видны читателю
TEST_F(LatchTest, MutatorsAreBroadcast)
{
    Latch latch;
    auto monitor = latch.watch();
    latch.on();
    EXPECT_TRUE(monitor.active());
    latch.off();
    EXPECT_FALSE(monitor.active());
    latch.toggle();
    EXPECT_TRUE(monitor.active());
    latch.toggle();
    EXPECT_FALSE(monitor.active());
}

// быстрое вкл-выкл между опросами не видно: читатель видит только состояние
TEST_F(LatchTest, RapidToggleIsInvisible)
{
    Latch latch;
    auto monitor = latch.watch();
    latch.toggle();
    latch.toggle();
    EXPECT_FALSE(monitor.active());
}

// читатель, созданный до переноса флага, остается подключен
TEST_F(LatchTest, MonitorSurvivesMove)
{
    Latch latch;
    auto monitor = latch.watch();
    Latch moved(std::move(latch));
    moved.on();
    EXPECT_TRUE(monitor.active());
}
