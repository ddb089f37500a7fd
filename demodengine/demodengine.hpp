/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <csdr/complex.hpp>
#include <csdr/writer.hpp>
#include <lorabridge/loraconfig.hpp>

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Lorabridge {

    class ConfigurationException: public std::runtime_error {
        public:
            ConfigurationException(const std::string& reason): std::runtime_error(reason) {}
    };

    // one decoded packet as emitted on the engine message port
    struct DecodedMessage {
        std::vector<unsigned char> payload;
        size_t sample_index = 0;
        bool crc_ok = true;

        DecodedMessage() = default;
        DecodedMessage(const std::string& text);
    };

    class MessageWriter {
        public:
            virtual ~MessageWriter() = default;
            virtual void sendMessage(DecodedMessage message) = 0;
    };

    // Opaque demodulator: samples come in through the csdr Writer interface
    // (data port), decoded packets go out through the message writer
    // (message port). Configured once, at construction.
    class DemodulationEngine: public Csdr::Writer<Csdr::complex<float>> {
        public:
            ~DemodulationEngine() override = default;
            virtual void setMessageWriter(MessageWriter* messageWriter) { this->messageWriter = messageWriter; }
            MessageWriter* getMessageWriter() const { return messageWriter; }
            // called once at shutdown, after the last advance()
            virtual void flush() {}
        protected:
            void publish(DecodedMessage message);
            MessageWriter* messageWriter = nullptr;
    };

    // builds an engine from the configuration; throws ConfigurationException
    using EngineFactory = std::function<DemodulationEngine*(const LoraConfig&)>;

}
