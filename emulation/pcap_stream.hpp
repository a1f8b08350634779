//
// Copyright (c) 2016-2017 Haggai Eran, Gabi Malka, Lior Zeno, Maroun Tork
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without modification,
// are permitted provided that the following conditions are met:
//
//  * Redistributions of source code must retain the above copyright notice, this
// list of conditions and the following disclaimer.
//  * Redistributions in binary form must reproduce the above copyright notice,
// this list of conditions and the following disclaimer in the documentation and/or
// other materials provided with the distribution.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS ``AS IS''
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR
// ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON
// ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//

#ifndef LLPC_PCAP_STREAM_HPP
#define LLPC_PCAP_STREAM_HPP

#include <cstdio>
#include <limits>
#include <string>

#include "stream_beat.hpp"

namespace emulation {

    /** Split a frame into beats, keep trimmed on the last beat. */
    void write_packet(const unsigned char *bytes, unsigned len, llpc::beat_stream& stream);

    /** Read packets [range_start, range_end) of a capture file into a beat
     * stream. Returns the number of packets in the file, or -1. */
    int read_pcap(const std::string& filename, llpc::beat_stream& stream,
                  int range_start = 0, int range_end = std::numeric_limits<int>::max());

    /** Reassemble egress beats into one record per end_of_packet, using the
     * bytes under each keep mask. Returns the number of records, or -1. */
    int write_pcap(FILE* file, llpc::beat_stream& stream);

    /** Helper function to get filename from temporary file. */
    std::string filename(FILE* file);
}

#endif // LLPC_PCAP_STREAM_HPP
