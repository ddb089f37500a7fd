/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace Lorabridge {

    class UsageException: public std::runtime_error {
        public:
            UsageException(const std::string& reason): std::runtime_error(reason) {}
    };

    enum class RemainderPolicy {
        Carry,      // keep stray bytes and prefix them to the next read
        Discard     // drop stray bytes at the end of every read
    };

    // LoRa receiver parameters, passed to the demodulation engine verbatim
    struct LoraConfig {
        double center_freq = 869100000;
        unsigned int bw = 125000;
        unsigned int cr = 2;            // 4/(4+cr)
        bool has_crc = true;
        bool impl_head = false;
        unsigned int pay_len = 255;
        unsigned int samp_rate = 250000;
        unsigned int sf = 7;
        std::vector<unsigned int> sync_word = { 0x34 };
        bool soft_decoding = false;
        unsigned int ldro_mode = 2;     // 0 off, 1 on, 2 auto
        std::vector<bool> print_rx = { true, true };
    };

    // everything the command line can set
    struct Options {
        LoraConfig lora;
        std::string input = "-";
        size_t output_multiple = 8020;
        double report_interval = 5.0;
        RemainderPolicy remainder = RemainderPolicy::Carry;
        bool help = false;
    };

    Options parseArguments(int argc, char* argv[]);
    std::string usage(const char* progname);
    std::string describe(const LoraConfig& config);

}
