/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <csdr/source.hpp>
#include <lorabridge/loraconfig.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace Lorabridge {

    class IOException: public std::runtime_error {
        public:
            IOException(const std::string& reason): std::runtime_error(reason) {}
    };

    // per-instance stream bookkeeping
    struct StreamState {
        size_t total_samples = 0;
        std::chrono::steady_clock::time_point start_time;
        std::chrono::steady_clock::time_point last_report;
        // stray bytes of the last read (carry policy only)
        unsigned char pending[16];
        size_t pending_bytes = 0;
    };

    // Pull-based sample source reading raw samples from stdin or a file.
    // work() never blocks: it polls the descriptor with a zero timeout and
    // returns 0 when nothing is ready, or WORK_DONE once the stream is closed.
    // Attaching a writer starts a driver thread that calls work() with as many
    // samples as the writer can take.
    template <typename T>
    class StdinSource: public Csdr::Source<T> {
        public:
            static constexpr long WORK_DONE = -1;

            StdinSource(const char* filename = nullptr,
                        RemainderPolicy remainder = RemainderPolicy::Carry,
                        std::ostream& diag = std::cerr);
            ~StdinSource();
            void setWriter(Csdr::Writer<T>* writer) override;
            void stop();
            bool isRunning() const;
            long work(T* output, size_t requested);
            size_t getTotalSamples() const { return state.total_samples; }
            size_t getPendingBytes() const { return state.pending_bytes; }
            // setters
            void setOutputMultiple(size_t multiple) { outputMultiple = multiple > 0 ? multiple : 1; }
            void setMaxChunk(size_t samples) { maxChunk = samples; }
            void setReportInterval(double seconds) { reportInterval = seconds; }
            void setIdleDelay(double seconds) { idleDelay = seconds; }
        private:
            void loop();
            void report(std::chrono::steady_clock::time_point now);
            int fd;
            bool ownsFd;
            RemainderPolicy remainder;
            std::ostream& diag;
            size_t outputMultiple = 8020;
            size_t maxChunk = 8020 * 8;
            double reportInterval = 5.0;
            double idleDelay = 0.001;
            StreamState state;
            std::atomic<bool> run;
            std::thread* thread = nullptr;
    };
}
