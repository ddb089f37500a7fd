/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <lorabridge/demodengine.hpp>

#include <condition_variable>
#include <cstdio>
#include <deque>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace Lorabridge {

    class MalformedMessageException: public std::runtime_error {
        public:
            MalformedMessageException(const std::string& reason): std::runtime_error(reason) {}
    };

    // Renders the payload as a single line of UTF-8 text. Trailing NUL
    // padding is dropped and control characters are escaped.
    std::string renderMessage(const DecodedMessage& message);

    // Message port that prints every decoded packet as one line on outfile.
    // sendMessage() only queues; a worker thread renders in arrival order.
    class MessageSink: public MessageWriter {
        public:
            MessageSink(FILE* outfile = stdout, std::ostream& diag = std::cerr);
            ~MessageSink() override;
            void sendMessage(DecodedMessage message) override;
            void start();
            // renders everything already queued, then stops the worker
            void stop();
            bool isRunning() const { return worker != nullptr; }
            size_t getRenderedCount();
            size_t getRejectedCount();
        private:
            void loop();
            void render(const DecodedMessage& message);
            FILE* outfile;
            std::ostream& diag;
            std::mutex queueMutex;
            std::condition_variable queueCondition;
            std::deque<DecodedMessage> queue;
            bool closed = false;
            size_t rendered = 0;
            size_t rejected = 0;
            std::thread* worker = nullptr;
    };
}
