#include <unistd.h>
#include <chrono>
#include <string>
#include <thread>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "output_collector.hpp"

using namespace std;
using namespace testbox;

TEST(StreamBufferTest, KeepsBytesUpToCap) {
    stream_buffer buffer(8);
    buffer.append("hello ", 6);
    EXPECT_FALSE(buffer.truncated());
    buffer.append("world", 5);
    EXPECT_TRUE(buffer.truncated());
    EXPECT_EQ(buffer.data(), "hello wo");
    EXPECT_EQ(buffer.total_bytes(), 11u);

    buffer.append("!!!", 3);
    EXPECT_EQ(buffer.data().size(), 8u);
    EXPECT_EQ(buffer.total_bytes(), 14u);
}

TEST(StreamBufferTest, ExactlyCapIsNotTruncated) {
    stream_buffer buffer(4);
    buffer.append("abcd", 4);
    EXPECT_FALSE(buffer.truncated());
    EXPECT_EQ(buffer.total_bytes(), 4u);
}

TEST(StreamBufferTest, FrozenBufferRejectsAppend) {
    stream_buffer buffer(4);
    buffer.freeze();
    EXPECT_TRUE(buffer.frozen());
    EXPECT_THROW(buffer.append("a", 1), logic_error);
}

static void write_all(int fd, const string &bytes) {
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = write(fd, bytes.data() + written, bytes.size() - written);
        ASSERT_GT(n, 0);
        written += n;
    }
}

TEST(OutputCollectorTest, CollectsBothStreams) {
    unique_fd out_read, out_write, err_read, err_write;
    make_pipe(out_read, out_write);
    make_pipe(err_read, err_write);

    output_collector collector(move(out_read), move(err_read), 1024);
    collector.start();

    write_all(out_write.get(), "to stdout\n");
    write_all(err_write.get(), "to stderr\n");
    out_write.reset();
    err_write.reset();

    collector.finish(chrono::seconds(1));
    stream_buffer out = collector.take_stdout(), err = collector.take_stderr();
    EXPECT_EQ(out.data(), "to stdout\n");
    EXPECT_EQ(err.data(), "to stderr\n");
    EXPECT_TRUE(out.frozen());
    EXPECT_FALSE(out.truncated());
}

TEST(OutputCollectorTest, LargeOutputIsTruncatedWithoutBlockingTheWriter) {
    unique_fd out_read, out_write, err_read, err_write;
    make_pipe(out_read, out_write);
    make_pipe(err_read, err_write);

    output_collector collector(move(out_read), move(err_read), 1000);
    collector.start();

    // far more than a pipe can hold, on both streams
    string chunk(1 << 16, 'x');
    for (int i = 0; i < 32; ++i) {
        write_all(out_write.get(), chunk);
        write_all(err_write.get(), chunk);
    }
    out_write.reset();
    err_write.reset();

    collector.finish(chrono::seconds(1));
    stream_buffer out = collector.take_stdout();
    EXPECT_TRUE(out.truncated());
    EXPECT_EQ(out.data().size(), 1000u);
    EXPECT_EQ(out.total_bytes(), 32u << 16);
    EXPECT_EQ(collector.take_stderr().total_bytes(), 32u << 16);
}

TEST(OutputCollectorTest, DrainTimeoutBoundsAnOpenWriter) {
    unique_fd out_read, out_write, err_read, err_write;
    make_pipe(out_read, out_write);
    make_pipe(err_read, err_write);

    output_collector collector(move(out_read), move(err_read), 1024);
    collector.start();
    write_all(out_write.get(), "partial");

    // the write ends stay open, as if an escaped process still held them
    auto begin = chrono::steady_clock::now();
    collector.finish(chrono::milliseconds(200));
    auto elapsed = chrono::steady_clock::now() - begin;
    EXPECT_GE(elapsed, chrono::milliseconds(150));
    EXPECT_LT(elapsed, chrono::seconds(2));
    EXPECT_EQ(collector.take_stdout().data(), "partial");
}

TEST(OutputCollectorTest, BuffersAreOnlyHandedOverAfterFinish) {
    unique_fd out_read, out_write, err_read, err_write;
    make_pipe(out_read, out_write);
    make_pipe(err_read, err_write);

    output_collector collector(move(out_read), move(err_read), 16);
    collector.start();
    EXPECT_THROW(collector.take_stdout(), logic_error);
    out_write.reset();
    err_write.reset();
    collector.finish(chrono::seconds(1));
    EXPECT_THROW(collector.finish(chrono::seconds(1)), logic_error);
}
