/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "loradecoderwriter.hpp"

#include <span>
#include <stdexcept>
#include <utility>

using namespace Lorabridge;

bool Lorabridge::ldroEnabled(const LoraConfig& config) {
    switch (config.ldro_mode) {
    case 0:
        return false;
    case 1:
        return true;
    default: {
        if (config.bw == 0 || config.sf > 12)
            throw ConfigurationException("invalid bandwidth or spreading factor");
        double symbol_ms = double(1u << config.sf) * 1000.0 / config.bw;
        return symbol_ms > 16.0;
    }
    }
}

lora::DecodeParams Lorabridge::toDecodeParams(const LoraConfig& config) {
    if (config.soft_decoding)
        throw ConfigurationException("soft decoding is not supported by the LoRa decoder");
    if (config.sync_word.size() != 1)
        throw ConfigurationException("exactly one sync word is supported");
    if (config.sync_word[0] > 0xff)
        throw ConfigurationException("sync word must fit in 8 bits");
    if (config.cr < 1 || config.cr > 4)
        throw ConfigurationException("coding rate must be between 1 and 4");
    if (config.ldro_mode > 2)
        throw ConfigurationException("ldro mode must be 0 (off), 1 (on) or 2 (auto)");
    if (config.bw == 0 || config.sf > 12)
        throw ConfigurationException("invalid bandwidth or spreading factor");
    if (config.impl_head && (config.pay_len < 1 || config.pay_len > 255))
        throw ConfigurationException("implicit header needs a payload length between 1 and 255");

    lora::DecodeParams params;
    params.sf = config.sf;
    params.bandwidth_hz = config.bw;
    params.sample_rate_hz = config.samp_rate;
    params.ldro_enabled = ldroEnabled(config);
    params.sync_word = config.sync_word[0];
    params.implicit_header = config.impl_head;
    params.implicit_payload_length = config.pay_len;
    params.implicit_has_crc = config.has_crc;
    params.implicit_cr = config.cr;
    return params;
}

static lora::StreamingReceiver makeReceiver(const LoraConfig& config) {
    lora::DecodeParams params = toDecodeParams(config);
    try {
        return lora::StreamingReceiver(params);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationException(std::string("LoRa decoder rejected configuration: ") + e.what());
    }
}

LoraDecoderWriter::LoraDecoderWriter(const LoraConfig& config, size_t buffer_size, std::ostream& diag):
    printHeader(config.print_rx.size() > 0 && config.print_rx[0]),
    printPayload(config.print_rx.size() > 1 && config.print_rx[1]),
    diag(diag),
    buffer(buffer_size),
    receiver(makeReceiver(config))
{}

size_t LoraDecoderWriter::writeable() {
    return buffer.size();
}

Csdr::complex<float>* LoraDecoderWriter::getWritePointer() {
    return buffer.data();
}

void LoraDecoderWriter::advance(size_t how_much) {
    samples.assign(buffer.begin(), buffer.begin() + how_much);
    auto events = receiver.push_samples(std::span<const lora::StreamingReceiver::Sample>(samples));
    for (auto& event: events)
        handle(event);
}

void LoraDecoderWriter::handle(const lora::StreamingReceiver::FrameEvent& event) {
    using Type = lora::StreamingReceiver::FrameEvent::Type;

    switch (event.type) {
    case Type::SyncAcquired:
        if (printHeader)
            diag << "sync acquired at sample " << event.global_sample_index << std::endl;
        break;
    case Type::HeaderDecoded:
        if (printHeader && event.header) {
            diag << "header: payload_length=" << event.header->payload_length
                 << " cr=4/" << event.header->cr + 4
                 << " crc=" << (event.header->has_crc ? "true" : "false") << std::endl;
        }
        break;
    case Type::PayloadByte:
        break;
    case Type::FrameDone:
        if (!event.result || !event.result->success) {
            diag << "WARNING: CRC check failed at sample " << event.global_sample_index << std::endl;
            break;
        }
        frames++;
        if (printPayload)
            diag << "payload: " << event.result->payload.size() << " bytes, CRC valid" << std::endl;
        {
            DecodedMessage message;
            message.payload = event.result->payload;
            message.sample_index = event.global_sample_index;
            message.crc_ok = event.result->payload_crc_ok;
            publish(std::move(message));
        }
        break;
    case Type::FrameError:
        diag << "WARNING: frame error at sample " << event.global_sample_index << ": " << event.message << std::endl;
        break;
    }
}

void LoraDecoderWriter::flush() {
    // a frame still pending here was cut off by the end of the stream
    receiver.reset();
    diag << "frames decoded: " << frames << std::endl;
}

DemodulationEngine* Lorabridge::makeLoraDecoderWriter(const LoraConfig& config) {
    return new LoraDecoderWriter(config);
}
