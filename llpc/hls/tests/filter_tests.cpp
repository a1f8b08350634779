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

#include <algorithm>

#include "gtest/gtest.h"
#include "filter.hpp"
#include "tb.h"

using namespace llpc;
using llpc_tb::packet;
using llpc_tb::packet_fields;
using llpc_tb::build_packet;

namespace {

    header_window window_of(const packet& p)
    {
        stream_beat first, second;

        first.set_data(reinterpret_cast<const char *>(p.data()), LLPC_BEAT_WIDTH_BYTES);
        second.set_data(reinterpret_cast<const char *>(p.data()) + LLPC_BEAT_WIDTH_BYTES,
                        std::min<unsigned>(LLPC_BEAT_WIDTH_BYTES, p.size() - LLPC_BEAT_WIDTH_BYTES));
        return make_window(first.data, second.data);
    }

    class filter_tests : public ::testing::Test
    {
    protected:
        filter_params params;
        packet_fields fields;
    };

    TEST_F(filter_tests, header_fields)
    {
        fields.saddr = 0xc0a80001;
        fields.source_port = 0x1111;
        parsed_headers hdr(window_of(build_packet(fields)));

        EXPECT_EQ(0xdeadbeefcafeull, hdr.eth.dest);
        EXPECT_EQ(0x020000000001ull, hdr.eth.source);
        EXPECT_EQ(0x0800, hdr.eth.proto);
        EXPECT_EQ(4, hdr.ip.version);
        EXPECT_EQ(5, hdr.ip.ihl);
        EXPECT_EQ(20 + 8 + 64, hdr.ip.tot_len);
        EXPECT_EQ(0x11, hdr.ip.protocol);
        EXPECT_EQ(0xc0a80001, hdr.ip.saddr);
        EXPECT_EQ(0x0a000102, hdr.ip.daddr);
        EXPECT_EQ(0x1111, hdr.udp.source);
        EXPECT_EQ(25565, hdr.udp.dest);
        EXPECT_EQ(8 + 64, hdr.udp.length);
    }

    TEST_F(filter_tests, matching_packet)
    {
        filter_checks c = evaluate(window_of(build_packet(fields)), params);

        EXPECT_FALSE(c.not_eth);
        EXPECT_FALSE(c.not_ip);
        EXPECT_FALSE(c.not_udp);
        EXPECT_TRUE(c.pass());
    }

    TEST_F(filter_tests, wrong_mac)
    {
        fields.dest_mac = 0xdeadbeefcaffull;
        filter_checks c = evaluate(window_of(build_packet(fields)), params);

        EXPECT_TRUE(c.not_eth);
        EXPECT_FALSE(c.not_ip);
        EXPECT_FALSE(c.not_udp);
        EXPECT_FALSE(c.pass());
    }

    TEST_F(filter_tests, wrong_mac_upper_bytes)
    {
        fields.dest_mac = 0x5eadbeefcafeull;
        EXPECT_FALSE(filters_valid(window_of(build_packet(fields)), params));
    }

    TEST_F(filter_tests, wrong_ethertype)
    {
        fields.ethertype = 0x86dd;
        filter_checks c = evaluate(window_of(build_packet(fields)), params);

        EXPECT_TRUE(c.not_eth);
        EXPECT_FALSE(c.pass());
    }

    TEST_F(filter_tests, ip_options_rejected)
    {
        fields.version_ihl = 0x46;
        filter_checks c = evaluate(window_of(build_packet(fields)), params);

        EXPECT_FALSE(c.not_eth);
        EXPECT_TRUE(c.not_ip);
    }

    TEST_F(filter_tests, ipv6_version_rejected)
    {
        fields.version_ihl = 0x65;
        EXPECT_TRUE(evaluate(window_of(build_packet(fields)), params).not_ip);
    }

    TEST_F(filter_tests, wrong_protocol)
    {
        fields.protocol = 6; /* TCP */
        filter_checks c = evaluate(window_of(build_packet(fields)), params);

        EXPECT_TRUE(c.not_ip);
        EXPECT_FALSE(c.not_udp);
    }

    TEST_F(filter_tests, destination_subnet)
    {
        const uint32_t inside[] = { 0x0a000100, 0x0a000101, 0x0a000102, 0x0a000103 };
        const uint32_t outside[] = { 0x0a000104, 0x0a0001ff, 0x0a000000, 0x0b000101 };

        for (uint32_t daddr : inside) {
            fields.daddr = daddr;
            EXPECT_FALSE(evaluate(window_of(build_packet(fields)), params).not_ip) << std::hex << daddr;
        }
        for (uint32_t daddr : outside) {
            fields.daddr = daddr;
            EXPECT_TRUE(evaluate(window_of(build_packet(fields)), params).not_ip) << std::hex << daddr;
        }
    }

    TEST_F(filter_tests, source_address_ignored)
    {
        fields.saddr = 0x08080808;
        fields.source_port = 53;
        fields.source_mac = 0xffffffffffffull;
        EXPECT_TRUE(filters_valid(window_of(build_packet(fields)), params));
    }

    TEST_F(filter_tests, wrong_port)
    {
        fields.dest_port = 25566;
        filter_checks c = evaluate(window_of(build_packet(fields)), params);

        EXPECT_FALSE(c.not_eth);
        EXPECT_FALSE(c.not_ip);
        EXPECT_TRUE(c.not_udp);
    }

    TEST_F(filter_tests, all_layers_wrong)
    {
        fields.dest_mac = 0x010203040506ull;
        fields.protocol = 1;
        fields.dest_port = 80;
        filter_checks c = evaluate(window_of(build_packet(fields)), params);

        EXPECT_TRUE(c.not_eth);
        EXPECT_TRUE(c.not_ip);
        EXPECT_TRUE(c.not_udp);
    }

    TEST_F(filter_tests, follows_parameters)
    {
        fields.dest_mac = 0x001122334455ull;
        fields.daddr = 0xc0a80a07;
        fields.dest_port = 9000;
        const header_window w = window_of(build_packet(fields));

        EXPECT_FALSE(filters_valid(w, params));

        params.local_mac = 0x001122334455ull;
        params.ip_base = 0xc0a80a00;
        params.ip_mask = 0xffffff00;
        params.udp_dest_port = 9000;
        EXPECT_TRUE(filters_valid(w, params));

        /* Same inputs, same result */
        EXPECT_TRUE(filters_valid(w, params));
    }

    TEST_F(filter_tests, payload_does_not_matter)
    {
        fields.payload_length = 22;
        fields.seed = 0x55;
        EXPECT_TRUE(filters_valid(window_of(build_packet(fields)), params));
    }
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
