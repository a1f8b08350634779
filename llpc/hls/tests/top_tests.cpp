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

#include <cstdio>
#include <vector>

#include "gtest/gtest.h"
#include "tb.h"
#include "llpc-top.hpp"

using namespace llpc;
using llpc_tb::packet;
using llpc_tb::packet_fields;
using llpc_tb::build_packet;
using llpc_tb::payload_of;
using llpc_tb::reassemble;
using std::vector;

namespace {

    class llpc_top_tests : public ::testing::Test
    {
    protected:
        llpc_top_tests() : ingress("ingress"), egress("egress") {}

        virtual void SetUp()
        {
            llpc_top(ingress, egress, true, &timing, gateway, &stats, true);
            EXPECT_EQ(0, timing.valid);
        }

        void clock(bool out_ready = true)
        {
            llpc_top(ingress, egress, out_ready, &timing, gateway, &stats, false);
            if (timing.valid)
                timestamps.push_back(timing.timestamp);
        }

        void run(unsigned cycles)
        {
            for (unsigned i = 0; i < cycles; ++i)
                clock();
        }

        void send(const packet& p)
        {
            emulation::write_packet(p.data(), p.size(), ingress);
        }

        /* Register access through the go/done handshake, one call per cycle */
        int gateway_access(int address, int data, bool write)
        {
            gateway.cmd.addr = address;
            gateway.cmd.write = write;
            gateway.data = data;
            gateway.cmd.go = 1;
            for (int i = 0; i < 10 && !gateway.done; ++i)
                clock();
            EXPECT_EQ(1, gateway.done);

            gateway.cmd.go = 0;
            for (int i = 0; i < 10 && gateway.done; ++i)
                clock();
            EXPECT_EQ(0, gateway.done);
            return gateway.data;
        }

        beat_stream ingress, egress;
        llpc_timing timing;
        gateway_registers gateway;
        parser_stats stats;
        vector<cycle_t> timestamps;
    };

    TEST_F(llpc_top_tests, forwards_matching_packet)
    {
        packet p = build_packet(packet_fields());
        send(p);
        run(20);

        vector<packet> out = reassemble(egress);
        ASSERT_EQ(1u, out.size());
        EXPECT_EQ(payload_of(p), out[0]);
        ASSERT_EQ(1u, timestamps.size());
        EXPECT_EQ(4u, timestamps[0]);
        EXPECT_EQ(1, stats.packets_passed);
    }

    TEST_F(llpc_top_tests, timing_pulse_lasts_one_cycle)
    {
        send(build_packet(packet_fields()));
        unsigned pulses = 0;
        for (int i = 0; i < 20; ++i) {
            clock();
            if (timing.valid)
                ++pulses;
            else
                EXPECT_EQ(0, timing.timestamp);
        }
        EXPECT_EQ(1u, pulses);
    }

    TEST_F(llpc_top_tests, buffers_input_without_downstream_ready)
    {
        packet_fields f;
        f.payload_length = 1000;
        packet p = build_packet(f);
        send(p);
        for (int i = 0; i < 10; ++i)
            clock(false);
        /* Admitted into the buffer, but no more than it can hold */
        EXPECT_FALSE(ingress.empty());
        EXPECT_TRUE(egress.empty());

        run(100);
        EXPECT_EQ(0, stats.fifo_overflow);
        EXPECT_EQ(1, stats.packets_passed);
        vector<packet> out = reassemble(egress);
        ASSERT_EQ(1u, out.size());
        EXPECT_EQ(payload_of(p), out[0]);
    }

    TEST_F(llpc_top_tests, gateway_reconfigures_filter)
    {
        gateway_access(LLPC_REG_UDP_PORT, 9000, true);
        EXPECT_EQ(9000, gateway_access(LLPC_REG_UDP_PORT, 0, false));

        packet_fields f;
        f.dest_port = 9000;
        packet accepted = build_packet(f);
        send(build_packet(packet_fields()));
        send(accepted);
        run(30);

        vector<packet> out = reassemble(egress);
        ASSERT_EQ(1u, out.size());
        EXPECT_EQ(payload_of(accepted), out[0]);
        EXPECT_EQ(1, stats.drop_filter);
        EXPECT_EQ(1, stats.filter_not_udp);
    }

    TEST_F(llpc_top_tests, gateway_write_applies_from_next_cycle)
    {
        packet_fields f;
        f.dest_port = 9000;
        packet p = build_packet(f);
        send(p);
        clock();
        clock();

        /* Served in the cycle that evaluates the header */
        gateway.cmd.addr = LLPC_REG_UDP_PORT;
        gateway.cmd.write = 1;
        gateway.data = 9000;
        gateway.cmd.go = 1;
        clock();
        EXPECT_EQ(1, gateway.done);
        gateway.cmd.go = 0;
        run(20);

        EXPECT_TRUE(egress.empty());
        EXPECT_EQ(1, stats.filter_not_udp);

        send(p);
        run(20);
        vector<packet> out = reassemble(egress);
        ASSERT_EQ(1u, out.size());
        EXPECT_EQ(payload_of(p), out[0]);
    }

    TEST_F(llpc_top_tests, reset_during_gateway_command)
    {
        gateway.cmd.addr = LLPC_REG_UDP_PORT;
        gateway.cmd.write = 1;
        gateway.data = 9000;
        gateway.cmd.go = 1;
        clock();
        EXPECT_EQ(1, gateway.done);

        SetUp();
        EXPECT_EQ(0, gateway.done);
        gateway.cmd.go = 0;
        clock();
        EXPECT_EQ(0, gateway.done);

        EXPECT_EQ(LLPC_DEFAULT_UDP_PORT, gateway_access(LLPC_REG_UDP_PORT, 0, false));
        gateway_access(LLPC_REG_UDP_PORT, 4791, true);
        EXPECT_EQ(4791, gateway_access(LLPC_REG_UDP_PORT, 0, false));
    }

    TEST_F(llpc_top_tests, gateway_mac_registers)
    {
        gateway_access(LLPC_REG_MAC_LO, 0x33445566, true);
        gateway_access(LLPC_REG_MAC_HI, 0x1122, true);
        EXPECT_EQ(0x33445566, gateway_access(LLPC_REG_MAC_LO, 0, false));
        EXPECT_EQ(0x1122, gateway_access(LLPC_REG_MAC_HI, 0, false));

        packet_fields f;
        f.dest_mac = 0x112233445566ull;
        packet p = build_packet(f);
        send(p);
        run(20);

        vector<packet> out = reassemble(egress);
        ASSERT_EQ(1u, out.size());
        EXPECT_EQ(payload_of(p), out[0]);
    }

    TEST_F(llpc_top_tests, gateway_unmapped_address)
    {
        EXPECT_EQ(int(LLPC_REG_UNMAPPED), gateway_access(0x7, 0, false));
    }

    TEST_F(llpc_top_tests, reset_restores_defaults)
    {
        gateway_access(LLPC_REG_UDP_PORT, 9000, true);
        send(build_packet(packet_fields()));
        run(20);
        EXPECT_EQ(1, stats.drop_filter);

        SetUp();
        EXPECT_EQ(LLPC_DEFAULT_UDP_PORT, gateway_access(LLPC_REG_UDP_PORT, 0, false));
        EXPECT_EQ(0, stats.drop_filter);
    }

    class pcap_tests : public llpc_top_tests
    {
    protected:
        /* Capture file holding the given frames */
        FILE* capture(const vector<packet>& packets)
        {
            beat_stream frames("frames");
            for (unsigned i = 0; i < packets.size(); ++i)
                emulation::write_packet(packets[i].data(), packets[i].size(), frames);

            FILE* f = tmpfile();
            EXPECT_TRUE(f != NULL);
            EXPECT_EQ(int(packets.size()), emulation::write_pcap(f, frames));
            return f;
        }

        vector<packet> load(FILE* f)
        {
            beat_stream frames("frames");
            EXPECT_LE(0, emulation::read_pcap(emulation::filename(f), frames));
            return reassemble(frames);
        }
    };

    TEST_F(pcap_tests, capture_round_trip)
    {
        vector<packet> packets;
        for (unsigned i = 0; i < 3; ++i) {
            packet_fields f;
            f.payload_length = 30 + 100 * i;
            f.seed = i;
            packets.push_back(build_packet(f));
        }

        FILE* f = capture(packets);
        EXPECT_EQ(packets, load(f));
        fclose(f);
    }

    TEST_F(pcap_tests, read_range)
    {
        vector<packet> packets;
        for (unsigned i = 0; i < 3; ++i) {
            packet_fields f;
            f.seed = i;
            packets.push_back(build_packet(f));
        }
        FILE* f = capture(packets);

        EXPECT_EQ(3, emulation::read_pcap(emulation::filename(f), ingress, 1, 2));
        vector<packet> selected = reassemble(ingress);
        ASSERT_EQ(1u, selected.size());
        EXPECT_EQ(packets[1], selected[0]);
        fclose(f);
    }

    TEST_F(pcap_tests, missing_file)
    {
        EXPECT_EQ(-1, emulation::read_pcap("/nonexistent/llpc.pcap", ingress));
        EXPECT_TRUE(ingress.empty());
    }

    TEST_F(pcap_tests, replay_capture)
    {
        vector<packet> packets, expected;
        for (unsigned i = 0; i < 4; ++i) {
            packet_fields f;
            f.payload_length = 64 + 50 * i;
            f.seed = i;
            /* Every other packet is addressed outside the local subnet */
            if (i % 2)
                f.daddr = 0x0a000202;
            else
                expected.push_back(payload_of(build_packet(f)));
            packets.push_back(build_packet(f));
        }

        FILE* in = capture(packets);
        EXPECT_EQ(4, emulation::read_pcap(emulation::filename(in), ingress));
        fclose(in);
        run(100);

        FILE* out = tmpfile();
        ASSERT_TRUE(out != NULL);
        EXPECT_EQ(2, emulation::write_pcap(out, egress));
        EXPECT_EQ(expected, load(out));
        fclose(out);

        EXPECT_EQ(2u, timestamps.size());
        EXPECT_EQ(2, stats.filter_not_ip);
    }
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
