/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "demodengine.hpp"

#include <utility>

using namespace Lorabridge;

DecodedMessage::DecodedMessage(const std::string& text):
    payload(text.begin(), text.end())
{}

void DemodulationEngine::publish(DecodedMessage message) {
    // without a connected message port the packet has nowhere to go
    if (messageWriter == nullptr)
        return;
    messageWriter->sendMessage(std::move(message));
}
