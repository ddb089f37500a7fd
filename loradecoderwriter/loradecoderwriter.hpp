/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <lorabridge/demodengine.hpp>
#include <streaming_receiver.hpp>

#include <iostream>
#include <vector>

namespace Lorabridge {

    // maps the receiver configuration onto the LoRa PHY decoder parameters;
    // throws ConfigurationException for settings the decoder cannot honour
    lora::DecodeParams toDecodeParams(const LoraConfig& config);

    // low data rate optimization is required above 16ms symbol time;
    // throws ConfigurationException when auto mode gets an impossible sf or bw
    bool ldroEnabled(const LoraConfig& config);

    class LoraDecoderWriter: public DemodulationEngine {
        public:
            LoraDecoderWriter(const LoraConfig& config, size_t buffer_size = 8020 * 4,
                              std::ostream& diag = std::cerr);
            size_t writeable() override;
            Csdr::complex<float>* getWritePointer() override;
            void advance(size_t how_much) override;
            void flush() override;
            size_t getFrameCount() const { return frames; }
            // reacts to one receiver event; advance() routes every event here
            void handle(const lora::StreamingReceiver::FrameEvent& event);
        private:
            bool printHeader;
            bool printPayload;
            std::ostream& diag;
            std::vector<Csdr::complex<float>> buffer;
            std::vector<lora::StreamingReceiver::Sample> samples;
            lora::StreamingReceiver receiver;
            size_t frames = 0;
    };

    DemodulationEngine* makeLoraDecoderWriter(const LoraConfig& config);
}
