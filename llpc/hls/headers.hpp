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

#ifndef LLPC_HEADERS_HPP
#define LLPC_HEADERS_HPP

#include <ap_int.h>

#include "llpc.h"

namespace llpc {

    /* Two consecutive admitted beats of a packet, first beat in the most
     * significant half. Recomputed every cycle. */
    typedef ap_uint<LLPC_WINDOW_WIDTH_BITS> header_window;

    /* Header bit offsets from the start of the window (network order):
       0x00 - eth.dest eth.source eth.proto
       0x0e - ip.version ip.ihl ip.tos ip.tot_len ... ip.protocol ... ip.saddr ip.daddr
       0x22 - udp.source udp.dest udp.length udp.checksum
       0x2a - payload */
    enum {
        ETH_OFFSET = 0x00 * 8,
        IP_OFFSET = 0x0e * 8,
        UDP_OFFSET = 0x22 * 8,
    };

    template <int offset, int bits>
    static inline ap_uint<bits> window_bits(const header_window& w)
    {
        return w(LLPC_WINDOW_WIDTH_BITS - 1 - offset, LLPC_WINDOW_WIDTH_BITS - offset - bits);
    }

    struct eth_header {
        explicit eth_header(const header_window& w) :
            dest(window_bits<ETH_OFFSET, 48>(w)),
            source(window_bits<ETH_OFFSET + 48, 48>(w)),
            proto(window_bits<ETH_OFFSET + 96, 16>(w))
        {}

        ap_uint<48> dest;
        ap_uint<48> source;
        ap_uint<16> proto;
    };

    /* Only the fields the filter and its diagnostics look at */
    struct ip_header {
        explicit ip_header(const header_window& w) :
            version(window_bits<IP_OFFSET, 4>(w)),
            ihl(window_bits<IP_OFFSET + 4, 4>(w)),
            tot_len(window_bits<IP_OFFSET + 16, 16>(w)),
            protocol(window_bits<IP_OFFSET + 72, 8>(w)),
            saddr(window_bits<IP_OFFSET + 96, 32>(w)),
            daddr(window_bits<IP_OFFSET + 128, 32>(w))
        {}

        ap_uint<4> version;
        ap_uint<4> ihl;
        ap_uint<16> tot_len;
        ap_uint<8> protocol;
        ap_uint<32> saddr;
        ap_uint<32> daddr;
    };

    struct udp_header {
        explicit udp_header(const header_window& w) :
            source(window_bits<UDP_OFFSET, 16>(w)),
            dest(window_bits<UDP_OFFSET + 16, 16>(w)),
            length(window_bits<UDP_OFFSET + 32, 16>(w))
        {}

        ap_uint<16> source;
        ap_uint<16> dest;
        ap_uint<16> length;
    };

    struct parsed_headers {
        explicit parsed_headers(const header_window& w) : eth(w), ip(w), udp(w) {}

        eth_header eth;
        ip_header ip;
        udp_header udp;
    };

    static inline header_window make_window(const ap_uint<LLPC_BEAT_WIDTH_BITS>& first,
                                            const ap_uint<LLPC_BEAT_WIDTH_BITS>& second)
    {
        header_window w;
        w(LLPC_WINDOW_WIDTH_BITS - 1, LLPC_BEAT_WIDTH_BITS) = first;
        w(LLPC_BEAT_WIDTH_BITS - 1, 0) = second;
        return w;
    }
}

#endif // LLPC_HEADERS_HPP
