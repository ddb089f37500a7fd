/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "loraconfig.hpp"

#include <cstdio>
#include <cstring>
#include <sstream>
#include <unistd.h>

using namespace Lorabridge;

static double parseDouble(const char* arg, const char* what) {
    double value;
    char extra;
    if (sscanf(arg, "%lf%c", &value, &extra) != 1)
        throw UsageException(std::string("invalid ") + what + ": " + arg);
    return value;
}

static unsigned int parseUnsigned(const char* arg, const char* what) {
    int value;
    char extra;
    // %i accepts hex (0x34) as well as decimal
    if (sscanf(arg, "%i%c", &value, &extra) != 1 || value < 0)
        throw UsageException(std::string("invalid ") + what + ": " + arg);
    return (unsigned int) value;
}

static std::vector<std::string> splitList(const char* arg) {
    std::vector<std::string> items;
    std::stringstream ss(arg);
    std::string item;
    while (std::getline(ss, item, ','))
        items.push_back(item);
    return items;
}

Options Lorabridge::parseArguments(int argc, char* argv[]) {
    Options options;
    LoraConfig& lora = options.lora;
    int opt;

    // getopt keeps global state; restart the scan for every call
    optind = 1;
    opterr = 0;
    while ((opt = getopt(argc, argv, "f:b:c:CNIl:s:S:w:DL:p:i:m:r:dh")) != -1) {
        switch (opt) {
        case 'f':
            lora.center_freq = parseDouble(optarg, "frequency");
            break;
        case 'b':
            lora.bw = parseUnsigned(optarg, "bandwidth");
            break;
        case 'c':
            lora.cr = parseUnsigned(optarg, "coding rate");
            break;
        case 'C':
            lora.has_crc = true;
            break;
        case 'N':
            lora.has_crc = false;
            break;
        case 'I':
            lora.impl_head = true;
            break;
        case 'l':
            lora.pay_len = parseUnsigned(optarg, "payload length");
            break;
        case 's':
            lora.samp_rate = parseUnsigned(optarg, "sample rate");
            break;
        case 'S':
            lora.sf = parseUnsigned(optarg, "spreading factor");
            break;
        case 'w': {
            lora.sync_word.clear();
            for (auto& item: splitList(optarg))
                lora.sync_word.push_back(parseUnsigned(item.c_str(), "sync word"));
            if (lora.sync_word.empty())
                throw UsageException("empty sync word list");
            break;
        }
        case 'D':
            lora.soft_decoding = true;
            break;
        case 'L':
            lora.ldro_mode = parseUnsigned(optarg, "ldro mode");
            break;
        case 'p': {
            auto flags = splitList(optarg);
            if (flags.size() != 2)
                throw UsageException(std::string("invalid print flags: ") + optarg);
            lora.print_rx.clear();
            for (auto& flag: flags)
                lora.print_rx.push_back(parseUnsigned(flag.c_str(), "print flag") != 0);
            break;
        }
        case 'i':
            options.input = optarg;
            break;
        case 'm':
            options.output_multiple = parseUnsigned(optarg, "output multiple");
            if (options.output_multiple == 0)
                throw UsageException("output multiple must be at least 1");
            break;
        case 'r':
            options.report_interval = parseDouble(optarg, "report interval");
            if (options.report_interval < 0)
                throw UsageException(std::string("invalid report interval: ") + optarg);
            break;
        case 'd':
            options.remainder = RemainderPolicy::Discard;
            break;
        case 'h':
            options.help = true;
            break;
        default:
            throw UsageException(std::string("unknown option or missing argument: -") + (char) optopt);
        }
    }
    if (optind < argc)
        throw UsageException(std::string("unexpected argument: ") + argv[optind]);

    return options;
}

std::string Lorabridge::usage(const char* progname) {
    std::ostringstream out;
    out << "Usage: " << progname << " [options] < samples.cf32" << std::endl
        << "  -f freq       center frequency in Hz" << std::endl
        << "  -b bw         bandwidth in Hz" << std::endl
        << "  -c cr         coding rate index (1..4, CR 4/(4+cr))" << std::endl
        << "  -C | -N       payload CRC present | absent" << std::endl
        << "  -I            implicit header mode" << std::endl
        << "  -l len        payload length (implicit header)" << std::endl
        << "  -s rate       sample rate in Hz" << std::endl
        << "  -S sf         spreading factor" << std::endl
        << "  -w sw[,sw]    sync word(s)" << std::endl
        << "  -D            soft decoding" << std::endl
        << "  -L mode       low data rate optimization (0 off, 1 on, 2 auto)" << std::endl
        << "  -p h,p        engine print flags for header and payload (0/1)" << std::endl
        << "  -i path       read samples from path instead of stdin" << std::endl
        << "  -m n          source output multiple in samples" << std::endl
        << "  -r secs       throughput report interval (0 disables)" << std::endl
        << "  -d            discard stray bytes instead of carrying them" << std::endl
        << "  -h            show this help" << std::endl;
    return out.str();
}

std::string Lorabridge::describe(const LoraConfig& config) {
    char syncWord[16] = "none";
    if (!config.sync_word.empty())
        snprintf(syncWord, sizeof(syncWord), "0x%02X", config.sync_word[0]);

    std::ostringstream out;
    out << "Freq: " << (long long) config.center_freq << "Hz"
        << ", SF" << config.sf
        << ", BW:" << config.bw << "Hz"
        << ", CR:4/" << config.cr + 4 << std::endl
        << "Sync: " << syncWord
        << ", CRC: " << (config.has_crc ? "true" : "false");
    return out.str();
}
