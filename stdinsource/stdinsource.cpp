/* -*- c++ -*- */
/*
 * Copyright 2021 Franco Venturi.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "stdinsource.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <exception>
#include <csdr/complex.hpp>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

using namespace Lorabridge;

template <typename T>
StdinSource<T>::StdinSource(const char* filename, RemainderPolicy remainder, std::ostream& diag):
    remainder(remainder),
    diag(diag),
    run(true)
{
    static_assert(sizeof(T) <= sizeof(StreamState::pending), "sample type too wide");

    if (filename == nullptr || strcmp(filename, "") == 0 || strcmp(filename, "-") == 0) {
        // default reads from stdin
        fd = fileno(stdin);
        ownsFd = false;
    } else {
        fd = open(filename, O_RDONLY);
        if (fd < 0)
            throw IOException(std::string("unable to open file for reading: ") + filename);
        ownsFd = true;
    }

    state.start_time = std::chrono::steady_clock::now();
    state.last_report = state.start_time;
}

template <typename T>
StdinSource<T>::~StdinSource() {
    stop();
    if (ownsFd)
        ::close(fd);
}

template <typename T>
void StdinSource<T>::setWriter(Csdr::Writer<T>* writer) {
    Csdr::Source<T>::setWriter(writer);
    if (thread == nullptr && writer != nullptr) {
        thread = new std::thread( [this] () { loop(); });
    }
}

template <typename T>
long StdinSource<T>::work(T* output, size_t requested) {
    auto now = std::chrono::steady_clock::now();
    if (reportInterval > 0 && now - state.last_report >= std::chrono::duration<double>(reportInterval))
        report(now);

    if (requested == 0)
        return 0;

    // zero timeout: the caller shares its thread with the rest of the pipeline
    struct pollfd pfd = { fd, POLLIN, 0 };
    int ready = poll(&pfd, 1, 0);
    if (ready < 0) {
        if (errno == EINTR || errno == EAGAIN)
            return 0;
        diag << "ERROR: poll on input failed: " << strerror(errno) << std::endl;
        return WORK_DONE;
    }
    if (ready == 0)
        return 0;
    if (pfd.revents & (POLLERR | POLLNVAL)) {
        diag << "ERROR: input stream is broken" << std::endl;
        return WORK_DONE;
    }
    // POLLHUP without data is reported by read() as end of file
    if (!(pfd.revents & (POLLIN | POLLHUP)))
        return 0;

    char* bytes = (char*) output;
    size_t offset = state.pending_bytes;
    std::memcpy(bytes, state.pending, offset);

    ssize_t read_bytes = read(fd, bytes + offset, requested * sizeof(T) - offset);
    if (read_bytes < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return 0;
        diag << "ERROR: read from input failed: " << strerror(errno) << std::endl;
        return WORK_DONE;
    }
    if (read_bytes == 0) {
        if (state.pending_bytes > 0)
            diag << "WARNING: dropping " << state.pending_bytes << " stray bytes at end of stream" << std::endl;
        state.pending_bytes = 0;
        return WORK_DONE;
    }

    size_t total = offset + read_bytes;
    size_t samples = std::min(total / sizeof(T), requested);
    size_t stray = total - samples * sizeof(T);
    if (remainder == RemainderPolicy::Carry) {
        std::memcpy(state.pending, bytes + samples * sizeof(T), stray);
        state.pending_bytes = stray;
    } else {
        state.pending_bytes = 0;
    }

    state.total_samples += samples;
    return samples;
}

template <typename T>
void StdinSource<T>::report(std::chrono::steady_clock::time_point now) {
    double elapsed = std::chrono::duration<double>(now - state.start_time).count();
    double rate = elapsed > 0 ? state.total_samples / elapsed : 0;
    diag << "samples: " << state.total_samples << ", rate: " << std::lround(rate) << "/sec" << std::endl;
    state.last_report = now;
}

template <typename T>
void StdinSource<T>::loop() {
    double delay_s;
    double delay_frac = modf(idleDelay, &delay_s);
    struct timespec idle = { long(delay_s), long(delay_frac * 1e9) };

    // the multiple can never exceed what an empty writer takes in one go
    size_t multiple = std::min({ outputMultiple, this->writer->writeable(), maxChunk });
    if (multiple == 0)
        multiple = 1;
    if (multiple < outputMultiple)
        diag << "WARNING: output multiple " << outputMultiple << " exceeds writer capacity, using " << multiple << std::endl;

    while (run) {
        // request whole output multiples only; less than one means the writer is full
        size_t requested = std::min(this->writer->writeable(), maxChunk);
        requested -= requested % multiple;

        long produced = work(this->writer->getWritePointer(), requested);
        if (produced == WORK_DONE) {
            run = false;
        } else if (produced > 0) {
            try {
                this->writer->advance(produced);
            } catch (const std::exception& e) {
                // the chunk is lost, the stream goes on
                diag << "ERROR: writer failed on " << produced << " samples: " << e.what() << std::endl;
            }
        } else {
            nanosleep(&idle, nullptr);
        }
    }
}

template <typename T>
void StdinSource<T>::stop() {
    run = false;
    if (thread != nullptr) {
        thread->join();
        delete(thread);
        thread = nullptr;
        diag << "total_samples: " << state.total_samples << std::endl;
    }
}

template <typename T>
bool StdinSource<T>::isRunning() const {
    return run;
}

namespace Lorabridge {
    template class StdinSource<Csdr::complex<short>>;
    template class StdinSource<Csdr::complex<float>>;
}
