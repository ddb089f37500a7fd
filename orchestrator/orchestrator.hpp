/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <csdr/complex.hpp>
#include <lorabridge/demodengine.hpp>
#include <lorabridge/loraconfig.hpp>
#include <lorabridge/messagesink.hpp>
#include <lorabridge/stdinsource.hpp>

#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>

namespace Lorabridge {

    // Owns the three stages of the receiver:
    //   StdinSource --samples--> DemodulationEngine --messages--> MessageSink
    // The engine is built by the factory from the LoRa configuration,
    // which is handed over untouched.
    class Orchestrator {
        public:
            Orchestrator(const Options& options, EngineFactory factory,
                         FILE* outfile = stdout, std::ostream& diag = std::cerr);
            ~Orchestrator();
            void run();
            // stops the source, waits delay seconds for the engine to settle,
            // then drains and stops the sink
            void stop(double delay = 0);
            bool isRunning() const;
            // returns once the input ends or terminate becomes non-zero
            void waitForTermination(const volatile std::sig_atomic_t& terminate) const;
            const LoraConfig& getConfig() const { return config; }
            StdinSource<Csdr::complex<float>>* getSource() const { return source.get(); }
            DemodulationEngine* getEngine() const { return engine.get(); }
            MessageSink* getSink() const { return sink.get(); }
        private:
            const LoraConfig config;
            std::ostream& diag;
            std::unique_ptr<MessageSink> sink;
            std::unique_ptr<DemodulationEngine> engine;
            std::unique_ptr<StdinSource<Csdr::complex<float>>> source;
            bool started = false;
            bool stopped = false;
    };
}
