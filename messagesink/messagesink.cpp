/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "messagesink.hpp"

#include <utility>

using namespace Lorabridge;

// length of the UTF-8 sequence starting at data[pos], 0 if invalid
static size_t utf8SequenceLength(const std::vector<unsigned char>& data, size_t pos, size_t end) {
    unsigned char lead = data[pos];
    size_t len;
    unsigned int codepoint;
    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xe0) == 0xc0) {
        len = 2;
        codepoint = lead & 0x1f;
    } else if ((lead & 0xf0) == 0xe0) {
        len = 3;
        codepoint = lead & 0x0f;
    } else if ((lead & 0xf8) == 0xf0) {
        len = 4;
        codepoint = lead & 0x07;
    } else {
        return 0;
    }
    if (pos + len > end)
        return 0;
    for (size_t i = 1; i < len; i++) {
        if ((data[pos + i] & 0xc0) != 0x80)
            return 0;
        codepoint = (codepoint << 6) | (data[pos + i] & 0x3f);
    }
    // reject overlong forms, surrogates and anything past U+10FFFF
    static const unsigned int minimum[] = { 0, 0, 0x80, 0x800, 0x10000 };
    if (codepoint < minimum[len] || codepoint > 0x10ffff || (codepoint >= 0xd800 && codepoint <= 0xdfff))
        return 0;
    return len;
}

std::string Lorabridge::renderMessage(const DecodedMessage& message) {
    const std::vector<unsigned char>& payload = message.payload;
    size_t end = payload.size();
    while (end > 0 && payload[end - 1] == 0)
        end--;

    std::string text;
    text.reserve(end);
    size_t pos = 0;
    while (pos < end) {
        size_t len = utf8SequenceLength(payload, pos, end);
        if (len == 0)
            throw MalformedMessageException("payload is not valid UTF-8 at byte " + std::to_string(pos));
        unsigned char c = payload[pos];
        if (len > 1 || (c >= 0x20 && c != 0x7f) || c == '\t') {
            text.append((const char*) &payload[pos], len);
        } else if (c == '\n') {
            text += "\\n";
        } else if (c == '\r') {
            text += "\\r";
        } else {
            char escaped[8];
            snprintf(escaped, sizeof(escaped), "\\x%02x", c);
            text += escaped;
        }
        pos += len;
    }
    return text;
}

MessageSink::MessageSink(FILE* outfile, std::ostream& diag):
    outfile(outfile),
    diag(diag)
{}

MessageSink::~MessageSink() {
    stop();
}

void MessageSink::start() {
    std::lock_guard<std::mutex> lock(queueMutex);
    if (worker == nullptr) {
        closed = false;
        worker = new std::thread( [this] () { loop(); });
    }
}

void MessageSink::stop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        closed = true;
    }
    queueCondition.notify_all();
    if (worker != nullptr) {
        worker->join();
        delete(worker);
        worker = nullptr;
    }
}

void MessageSink::sendMessage(DecodedMessage message) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        queue.push_back(std::move(message));
    }
    queueCondition.notify_one();
}

size_t MessageSink::getRenderedCount() {
    std::lock_guard<std::mutex> lock(queueMutex);
    return rendered;
}

size_t MessageSink::getRejectedCount() {
    std::lock_guard<std::mutex> lock(queueMutex);
    return rejected;
}

void MessageSink::loop() {
    std::unique_lock<std::mutex> lock(queueMutex);
    while (true) {
        queueCondition.wait(lock, [this] { return closed || !queue.empty(); });
        // drain before honouring close
        if (queue.empty())
            break;
        DecodedMessage message = std::move(queue.front());
        queue.pop_front();
        lock.unlock();
        render(message);
        lock.lock();
    }
}

void MessageSink::render(const DecodedMessage& message) {
    std::string text;
    try {
        text = renderMessage(message);
    } catch (const MalformedMessageException& e) {
        diag << "failed to decode message: " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(queueMutex);
        rejected++;
        return;
    }

    fputs(text.c_str(), outfile);
    putc('\n', outfile);
    fflush(outfile);

    diag << "decoded message: " << text << std::endl;

    std::lock_guard<std::mutex> lock(queueMutex);
    rendered++;
}
