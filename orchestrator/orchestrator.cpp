/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "orchestrator.hpp"

#include <algorithm>
#include <cmath>
#include <time.h>

using namespace Lorabridge;

Orchestrator::Orchestrator(const Options& options, EngineFactory factory,
                           FILE* outfile, std::ostream& diag):
    config(options.lora),
    diag(diag)
{
    diag << "=== LoRa Receiver STARTING ===" << std::endl;
    diag << describe(config) << std::endl;

    sink.reset(new MessageSink(outfile, diag));

    engine.reset(factory(config));
    if (engine == nullptr)
        throw ConfigurationException("no demodulation engine for this configuration");

    source.reset(new StdinSource<Csdr::complex<float>>(options.input.c_str(), options.remainder, diag));
    source->setOutputMultiple(options.output_multiple);
    source->setMaxChunk(std::max(options.output_multiple, (size_t) 8020 * 8));
    source->setReportInterval(options.report_interval);
}

Orchestrator::~Orchestrator() {
    if (started)
        stop();
}

void Orchestrator::run()
{
    if (started)
        return;
    started = true;

    // start downstream first
    sink->start();
    engine->setMessageWriter(sink.get());

    // attaching the writer starts the source
    source->setWriter(engine.get());

    diag << "=== Waiting for LoRa packets... ===" << std::endl;
}

void Orchestrator::stop(double delay)
{
    if (!started || stopped)
        return;
    stopped = true;

    // stop the source first
    source->stop();

    // sleep for some time to let the engine settle
    if (delay > 0) {
        double delay_s;
        double delay_frac = modf(delay, &delay_s);
        struct timespec request_time = { long(delay_s), long(delay_frac * 1e9) };
        nanosleep(&request_time, nullptr);
    }

    engine->flush();

    // renders whatever the engine already published
    sink->stop();

    diag << "=== LoRa Receiver STOPPED ===" << std::endl;
}

bool Orchestrator::isRunning() const
{
    return started && !stopped && source->isRunning();
}

void Orchestrator::waitForTermination(const volatile std::sig_atomic_t& terminate) const
{
    struct timespec delay = { 0, 100000000 };   // 100ms delay

    while (!terminate && isRunning())
        nanosleep(&delay, nullptr);
}
