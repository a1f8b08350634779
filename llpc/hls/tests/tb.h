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

#include <string>
#include <vector>
#include <cstdint>

#include "gtest/gtest.h"

#include "llpc.h"
#include "packet_parser-impl.hpp"
#include "filter_config.hpp"
#include "pcap_stream.hpp"

namespace llpc_tb {
    typedef std::vector<unsigned char> packet;

    /* Header fields of a generated Ethernet/IPv4/UDP packet. The defaults
     * match the filter's power-on configuration. */
    struct packet_fields {
        packet_fields();

        uint64_t dest_mac;
        uint64_t source_mac;
        uint16_t ethertype;
        uint8_t version_ihl;
        uint8_t protocol;
        uint32_t saddr;
        uint32_t daddr;
        uint16_t source_port;
        uint16_t dest_port;
        unsigned payload_length;
        unsigned char seed;
    };

    packet build_packet(const packet_fields& f);
    /* Bytes following the 42 byte header */
    packet payload_of(const packet& p);
    /* Reassemble egress beats, one packet per end_of_packet */
    std::vector<packet> reassemble(llpc::beat_stream& stream);

    /* Drives a packet_parser one cycle at a time from an ingress stream and
     * collects its outputs. */
    template <size_t fifo_depth = LLPC_FIFO_DEPTH>
    class testbench
    {
    public:
        testbench() : ingress("ingress"), egress("egress"), cycle(0) {}

        void send(const packet& p)
        {
            emulation::write_packet(p.data(), p.size(), ingress);
        }

        void send(const llpc::stream_beat& b)
        {
            ingress.write(b);
        }

        void clock(bool out_ready = true)
        {
            llpc::stream_beat in, out;
            llpc::timestamp_t ts;

            if (parser.in_ready(out_ready) && !ingress.empty()) {
                in = ingress.read();
                admit_cycles.push_back(cycle);
            }

            parser.step(in, out_ready, config.params(), out, ts);

            if (out.valid) {
                EXPECT_TRUE(out_ready) << "egress beat without downstream ready";
                egress.write(out);
                egress_cycles.push_back(cycle);
            }
            if (ts.valid())
                timestamps.push_back(ts.value());

            EXPECT_LE(parser.buffered(), fifo_depth);
            ready_history.push_back(out_ready);
            ++cycle;
        }

        void run(unsigned cycles, bool out_ready = true)
        {
            for (unsigned i = 0; i < cycles; ++i)
                clock(out_ready);
        }

        /* Clock until the input is consumed and the pipeline drained */
        void drain()
        {
            for (unsigned i = 0; i < 10000 && !ingress.empty(); ++i)
                clock();
            run(LLPC_PIPELINE_DEPTH + fifo_depth + 2);
        }

        std::vector<packet> output() { return reassemble(egress); }

        llpc::packet_parser<fifo_depth> parser;
        llpc::filter_config config;
        llpc::beat_stream ingress, egress;
        std::vector<llpc::cycle_t> timestamps;
        std::vector<unsigned> admit_cycles, egress_cycles;
        /* out_ready of every clocked cycle */
        std::vector<bool> ready_history;
        unsigned cycle;
    };
}
