// GTest
#include <gtest/gtest.h>

// standard
#include <cstring>
#include <string>

// rubus
#include <common/plain-buffer.hpp>
#include <common/exceptions.hpp>

TEST(PlainBufferTest, IOOperationsTest) {
    std::size_t bufferSize = 20;
    rubus::PlainBuffer buffer (bufferSize);

    char str[14] = "hello, world!";
    auto written = buffer.write(str, sizeof(str));

    EXPECT_EQ(written, sizeof(str));
    EXPECT_EQ(buffer.writableSize(), bufferSize - sizeof(str));
    EXPECT_EQ(buffer.readableSize(), sizeof(str));

    char dest[sizeof(str)];
    buffer.read(dest, sizeof(str));

    EXPECT_EQ(buffer.writableSize(), bufferSize - sizeof(str));
    EXPECT_EQ(buffer.readableSize(), 0);

    EXPECT_EQ(std::memcmp(dest, str, sizeof(str)), 0);

    buffer.write(str, sizeof(str));
    buffer.reset();

    EXPECT_EQ(buffer.writableSize(), bufferSize);
    EXPECT_EQ(buffer.readableSize(), 0);

    EXPECT_EQ(std::memcmp(str, buffer.rPosition(), sizeof(str)), 0);

    buffer.advance(rubus::PlainBuffer::EPosition::WPOS, buffer.writableSize());
    buffer.advance(rubus::PlainBuffer::EPosition::RPOS, sizeof(str));

    EXPECT_EQ(buffer.writableSize(), 0);
    EXPECT_EQ(buffer.readableSize(), bufferSize - sizeof(str));
}

TEST(PlainBufferTest, PeekDoesNotConsume) {
    rubus::PlainBuffer buffer (8);
    buffer.write("abcd", 4);

    char dest[4];
    EXPECT_EQ(buffer.peek(dest, 4), 4);
    EXPECT_EQ(buffer.readableSize(), 4);
    EXPECT_EQ(buffer.view(), "abcd");

    EXPECT_EQ(buffer.drop(2), 2);
    EXPECT_EQ(buffer.view(), "cd");
}

TEST(PlainBufferTest, FixedBufferTruncatesAndRefusesReserve) {
    rubus::PlainBuffer buffer (4);
    EXPECT_EQ(buffer.write("abcdef", 6), 4);
    EXPECT_EQ(buffer.view(), "abcd");

    EXPECT_THROW(buffer.reserve(1), rubus::RubusOverrun);

    // compaction frees room consumed by reader
    buffer.drop(3);
    buffer.reserve(3);
    EXPECT_GE(buffer.writableSize(), 3);
    EXPECT_EQ(buffer.view(), "d");
}

TEST(PlainBufferTest, GrowableBufferKeepsAllBytes) {
    rubus::PlainBuffer buffer (4, true);
    std::string payload (1000, 'x');
    payload[999] = 'y';

    EXPECT_EQ(buffer.write(payload.data(), payload.size()), payload.size());
    EXPECT_EQ(buffer.readableSize(), payload.size());
    EXPECT_EQ(buffer.view(), payload);

    buffer.reserve(16);
    std::memcpy(buffer.wPosition(), "tail", 4);
    buffer.advance(rubus::PlainBuffer::EPosition::WPOS, 4);
    EXPECT_EQ(buffer.view().substr(1000), "tail");
}

TEST(PlainBufferTest, ShrinkReleasesGrownStorage) {
    rubus::PlainBuffer buffer (16, true);
    std::string payload (1000, 'x');
    buffer.write(payload.data(), payload.size());
    EXPECT_GE(buffer.capacity(), 1000u);

    // readable bytes survive shrink
    buffer.drop(990);
    buffer.shrink(16);
    EXPECT_EQ(buffer.capacity(), 16u);
    EXPECT_EQ(buffer.view(), std::string(10, 'x'));

    buffer.reset();
    buffer.shrink(4);
    EXPECT_EQ(buffer.capacity(), 4u);

    // never grows storage
    buffer.shrink(64);
    EXPECT_EQ(buffer.capacity(), 4u);
}
