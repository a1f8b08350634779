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

#include "llpc-top.hpp"
#include "packet_parser-impl.hpp"

using namespace llpc;

void llpc_top(beat_stream& ingress, beat_stream& egress, bool out_ready,
              llpc_timing* timing, gateway_registers& gateway,
              parser_stats* stats, bool reset)
{
#pragma HLS INTERFACE axis port=ingress
#pragma HLS INTERFACE axis port=egress
#pragma HLS interface ap_none port=out_ready
#pragma HLS interface ap_none port=timing
#ifdef SIMULATION_BUILD
#  pragma HLS INTERFACE ap_ctrl_hs port=return
#else
#  pragma HLS INTERFACE ap_ctrl_none port=return
    GATEWAY_OFFSET(gateway, 0x10, 0x18, 0x28)
#  pragma HLS INTERFACE s_axilite port=stats offset=0x100
#endif
#pragma HLS pipeline ii=1 enable_flush

    static packet_parser<LLPC_FIFO_DEPTH> parser;
    static filter_config config;

    if (reset) {
        parser.reset();
        config.reset();
        gateway.done = 0;
        *timing = llpc_timing();
        return;
    }

    stream_beat in;
    if (parser.in_ready(out_ready) && !ingress.empty()) {
        in = ingress.read();
        in.valid = 1;
    }

    stream_beat out;
    timestamp_t ts;
    parser.step(in, out_ready, config.params(), out, ts);

    if (out.valid)
        egress.write(out);

    /* Register writes apply from the next cycle */
    filter_config::gateway(&config, gateway);

    timing->timestamp = ts.value_or(cycle_t(0));
    timing->valid = ts.valid();

    *stats = parser.stats();
}
