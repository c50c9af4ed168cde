#include <gtest/gtest.h>
#include <boost/asio/buffer.hpp>
#include <chrono>
#include <string>
#include "io/progress_writer.hpp"
#include "io/windowed_progress_writer.hpp"
#include "io/memory_streams.hpp"

class ProgressWriterTest : public ::testing::Test
{
protected:
    Memory_sink sink;
};

TEST_F(ProgressWriterTest, StartsAtZero)
{
    Progress_writer<Memory_sink&> writer(sink);
    auto monitor = writer.progress();
    EXPECT_EQ(monitor.get().progress, Transfer_progress{});
}

// считается только то, что приемник принял
TEST_F(ProgressWriterTest, CountsOnlyWrittenPrefix)
{
    sink.max_per_write = 4;
    Progress_writer<Memory_sink&> writer(sink);
    auto monitor = writer.progress();
    std::string data("a\nb\nc\0d\n", 8);
    boost::system::error_code ec;
    ASSERT_EQ(writer.write_some(boost::asio::buffer(data), ec), 4u);
    EXPECT_EQ(monitor.get().progress, (Transfer_progress{4, 2, 0}));

    ASSERT_EQ(writer.write_some(boost::asio::buffer(data.data() + 4, 4), ec), 4u);
    EXPECT_EQ(monitor.get().progress, (Transfer_progress{8, 3, 1}));
    EXPECT_EQ(monitor.get().progress.bytes_transferred, sink.data.size());
}

// при ошибке счетчики не меняются
TEST_F(ProgressWriterTest, FailedWriteNotCounted)
{
    sink.fail_with = boost::asio::error::broken_pipe;
    Progress_writer<Memory_sink&> writer(sink);
    auto monitor = writer.progress();
    std::string data("abc");
    boost::system::error_code ec;
    EXPECT_EQ(writer.write_some(boost::asio::buffer(data), ec), 0u);
    EXPECT_TRUE(ec);
    EXPECT_EQ(monitor.get().progress.bytes_transferred, 0u);
}

class WindowedProgressWriterTest : public ::testing::Test
{
protected:
    Memory_sink sink;
};

TEST_F(WindowedProgressWriterTest, InitialRateIsZero)
{
    Windowed_progress_writer<Memory_sink&> writer(sink, std::chrono::seconds(1));
    auto rates = writer.rates();
    EXPECT_DOUBLE_EQ(rates.get().bytes_per_sec, 0.0);
    EXPECT_EQ(rates.get().measured_at, std::chrono::steady_clock::time_point{});
}

// 1000 байт в окне 2 с дают 500 байт/с
TEST_F(WindowedProgressWriterTest, PublishesWindowedMean)
{
    Windowed_progress_writer<Memory_sink&> writer(sink, std::chrono::seconds(2));
    auto rates = writer.rates();
    std::string data(1000, '\n');
    boost::system::error_code ec;
    auto before = std::chrono::steady_clock::now();
    ASSERT_EQ(writer.write_some(boost::asio::buffer(data), ec), 1000u);
    auto rate = rates.get();
    EXPECT_GE(rate.measured_at, before);
    EXPECT_FALSE(rate.expired(std::chrono::seconds(2), rate.measured_at));
    EXPECT_DOUBLE_EQ(rate.bytes_per_sec, 500.0);
    EXPECT_DOUBLE_EQ(rate.lines_per_sec, 500.0);
    EXPECT_DOUBLE_EQ(rate.nulls_per_sec, 0.0);
}

TEST_F(WindowedProgressWriterTest, CountsOnlyWrittenPrefix)
{
    sink.max_per_write = 100;
    Windowed_progress_writer<Memory_sink&> writer(sink, std::chrono::seconds(1));
    auto rates = writer.rates();
    std::string data(1000, 'x');
    boost::system::error_code ec;
    ASSERT_EQ(writer.write_some(boost::asio::buffer(data), ec), 100u);
    EXPECT_DOUBLE_EQ(rates.get().bytes_per_sec, 100.0);
}
