/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <lorabridge/messagesink.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace Lorabridge;

namespace {

    DecodedMessage bytes(std::initializer_list<unsigned char> payload) {
        DecodedMessage message;
        message.payload = payload;
        return message;
    }

    std::string contents(FILE* file) {
        std::string text;
        fflush(file);
        rewind(file);
        int c;
        while ((c = fgetc(file)) != EOF)
            text += (char) c;
        return text;
    }

    std::vector<std::string> lines(const std::string& text) {
        std::vector<std::string> result;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line))
            result.push_back(line);
        return result;
    }

    // reads whatever reached the pipe within the timeout
    std::string readAvailable(int fd, int timeoutMs) {
        std::string text;
        struct pollfd pfd = { fd, POLLIN, 0 };
        while (poll(&pfd, 1, timeoutMs) > 0) {
            char buffer[256];
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n <= 0)
                break;
            text.append(buffer, n);
            if (!text.empty() && text.back() == '\n')
                break;
        }
        return text;
    }

}

TEST(RenderMessageTest, PlainTextIsUnchanged) {
    EXPECT_EQ(renderMessage(DecodedMessage("hello stupid world")), "hello stupid world");
}

TEST(RenderMessageTest, EmptyPayloadIsAnEmptyLine) {
    EXPECT_EQ(renderMessage(DecodedMessage()), "");
}

TEST(RenderMessageTest, MultibyteUtf8IsKept) {
    EXPECT_EQ(renderMessage(DecodedMessage("h\xc3\xa9llo \xe2\x82\xac \xf0\x9f\x93\xa1")),
              "h\xc3\xa9llo \xe2\x82\xac \xf0\x9f\x93\xa1");
}

TEST(RenderMessageTest, TrailingNulPaddingIsDropped) {
    EXPECT_EQ(renderMessage(bytes({ 'o', 'k', 0, 0, 0 })), "ok");
}

TEST(RenderMessageTest, ControlCharactersAreEscapedToKeepOneLine) {
    EXPECT_EQ(renderMessage(DecodedMessage("a\nb\rc\td")), "a\\nb\\rc\td");
    EXPECT_EQ(renderMessage(bytes({ 'x', 0, 'y', 0x1b, 0x7f })), "x\\x00y\\x1b\\x7f");
}

TEST(RenderMessageTest, InvalidUtf8IsRejected) {
    EXPECT_THROW(renderMessage(bytes({ 'a', 0xff })), MalformedMessageException);
    // truncated sequence
    EXPECT_THROW(renderMessage(bytes({ 0xe2, 0x82 })), MalformedMessageException);
    // overlong encoding of '/'
    EXPECT_THROW(renderMessage(bytes({ 0xc0, 0xaf })), MalformedMessageException);
    // UTF-16 surrogate
    EXPECT_THROW(renderMessage(bytes({ 0xed, 0xa0, 0x80 })), MalformedMessageException);
}

TEST(MessageSinkTest, WritesOneLinePerMessageInOrder) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    std::ostringstream diag;
    {
        MessageSink sink(out, diag);
        sink.start();
        sink.sendMessage(DecodedMessage("A"));
        sink.sendMessage(DecodedMessage("B"));
        sink.sendMessage(DecodedMessage("C"));
        sink.stop();
        EXPECT_EQ(sink.getRenderedCount(), 3u);
    }
    EXPECT_EQ(contents(out), "A\nB\nC\n");
    fclose(out);
}

TEST(MessageSinkTest, MirrorsMessagesToDiagnostics) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    std::ostringstream diag;
    MessageSink sink(out, diag);
    sink.start();
    sink.sendMessage(DecodedMessage("A"));
    sink.stop();
    EXPECT_NE(diag.str().find("decoded message: A"), std::string::npos);
    fclose(out);
}

TEST(MessageSinkTest, MessagesQueuedBeforeStartAreRendered) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    std::ostringstream diag;
    MessageSink sink(out, diag);
    sink.sendMessage(DecodedMessage("early"));
    sink.start();
    sink.sendMessage(DecodedMessage("late"));
    sink.stop();
    EXPECT_EQ(contents(out), "early\nlate\n");
    fclose(out);
}

TEST(MessageSinkTest, MalformedMessageIsSkippedAndLaterOnesSurvive) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    std::ostringstream diag;
    MessageSink sink(out, diag);
    sink.start();
    sink.sendMessage(DecodedMessage("A"));
    sink.sendMessage(bytes({ 0xfe, 0xfe }));
    sink.sendMessage(DecodedMessage("C"));
    sink.stop();

    EXPECT_EQ(contents(out), "A\nC\n");
    EXPECT_EQ(sink.getRenderedCount(), 2u);
    EXPECT_EQ(sink.getRejectedCount(), 1u);
    EXPECT_NE(diag.str().find("failed to decode message"), std::string::npos);
    fclose(out);
}

TEST(MessageSinkTest, BurstFromProducerThreadKeepsArrivalOrder) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    std::ostringstream diag;
    MessageSink sink(out, diag);
    sink.start();

    const int count = 2000;
    std::thread producer([&sink] () {
        for (int i = 0; i < count; i++)
            sink.sendMessage(DecodedMessage("packet " + std::to_string(i)));
    });
    producer.join();
    sink.stop();

    auto result = lines(contents(out));
    ASSERT_EQ(result.size(), (size_t) count);
    for (int i = 0; i < count; i++)
        ASSERT_EQ(result[i], "packet " + std::to_string(i));
    fclose(out);
}

TEST(MessageSinkTest, EachLineIsFlushedImmediately) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    FILE* out = fdopen(fds[1], "w");
    ASSERT_NE(out, nullptr);
    // full buffering would hold the line back without an explicit flush
    setvbuf(out, nullptr, _IOFBF, 4096);

    std::ostringstream diag;
    MessageSink sink(out, diag);
    sink.start();

    sink.sendMessage(DecodedMessage("first"));
    EXPECT_EQ(readAvailable(fds[0], 2000), "first\n");
    sink.sendMessage(DecodedMessage("second"));
    EXPECT_EQ(readAvailable(fds[0], 2000), "second\n");

    sink.stop();
    fclose(out);
    close(fds[0]);
}

TEST(MessageSinkTest, StopIsIdempotent) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    std::ostringstream diag;
    MessageSink sink(out, diag);
    sink.start();
    EXPECT_TRUE(sink.isRunning());
    sink.stop();
    sink.stop();
    EXPECT_FALSE(sink.isRunning());
    fclose(out);
}
