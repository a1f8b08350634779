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

#pragma once

#include <ostream>

#include "llpc.h"
#include "stream_beat.hpp"
#include "headers.hpp"
#include "filter.hpp"
#include "beat_history.hpp"
#include "output_fifo.hpp"
#include "cycle_counter.hpp"
#include "maybe.hpp"

namespace llpc {

    enum parser_state { IDLE, PARSE_HEADER, STREAM_PAYLOAD };

    std::ostream& operator<<(std::ostream& out, parser_state s);

    struct parser_stats {
        parser_stats() :
            packets_admitted(),
            packets_passed(),
            first_beat_rejected(),
            drop_truncated(),
            drop_filter(),
            filter_not_eth(),
            filter_not_ip(),
            filter_not_udp(),
            beats_bypassed(),
            beats_buffered(),
            fifo_overflow()
        {}

        /* Packets that entered PARSE_HEADER */
        ap_uint<64> packets_admitted;
        /* Packets forwarded and timestamped */
        ap_uint<64> packets_passed;
        /* Packet starts that were partial or single beat */
        ap_uint<64> first_beat_rejected;
        ap_uint<64> drop_truncated;
        ap_uint<64> drop_filter;
        ap_uint<64> filter_not_eth;
        ap_uint<64> filter_not_ip;
        ap_uint<64> filter_not_udp;
        ap_uint<64> beats_bypassed;
        ap_uint<64> beats_buffered;
        ap_uint<64> fifo_overflow;
    };

    std::ostream& operator<<(std::ostream& out, const parser_stats& s);

    typedef maybe<cycle_t> timestamp_t;

    /* Header parsing pipeline. step() is called once per cycle:
     *
     *   ingress -> stage 1 register -> parser -> payload register -> egress mux
     *                                                |                  |
     *                                          header window       bypass or FIFO
     *
     * A beat admitted at cycle N reaches the parser at N + 1 and the egress
     * mux at N + 2. The egress mux forwards the payload register directly
     * when the FIFO is empty and the consumer is ready, otherwise it queues
     * it and drains the FIFO head whenever the consumer is ready. */
    template <size_t fifo_depth = LLPC_FIFO_DEPTH>
    class packet_parser
    {
    public:
        static_assert(fifo_depth > LLPC_PIPELINE_DEPTH,
                      "the output FIFO must hold the beats in the pipeline registers");

        typedef output_fifo<stream_beat, fifo_depth> fifo_t;

        packet_parser();

        /* Upstream readiness for the current cycle. Must be sampled before
         * step(); a valid beat is admitted only while it is true. */
        bool in_ready(bool out_ready) const;

        void step(const stream_beat& in, bool out_ready, const filter_params& p,
                  stream_beat& out, timestamp_t& timestamp);

        void reset();

        parser_state state() const { return _state; }
        const parser_stats& stats() const { return _stats; }
        cycle_t cycle() const { return _clock.now(); }
        unsigned buffered() const { return _fifo.count(); }

        /* The first beat of a packet and the one after it are both valid and
         * the first beat fills the whole beat width */
        static bool buffer_valid(const stream_beat& first, const stream_beat& second);
        /* The second beat carries the rest of the 42 byte header */
        static bool header_complete(const stream_beat& second);
        /* Second beat of a packet with its header bytes masked out */
        static stream_beat first_payload_beat(const stream_beat& second);

    private:
        void egress_mux(bool out_ready, stream_beat& out);
        stream_beat parse(const stream_beat& b, const filter_params& p, timestamp_t& timestamp);
        void drop(const filter_checks& c, bool truncated);
        void finish(timestamp_t& timestamp);

        parser_state _state;
        /* The next admitted beat starts a packet */
        bool _sop;
        cycle_t _start_cycle;

        stream_beat _stage1;
        stream_beat _payload;
        beat_history<LLPC_HISTORY_DEPTH> _history;
        fifo_t _fifo;
        cycle_counter _clock;

        parser_stats _stats;
    };
}
