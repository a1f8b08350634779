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

#include "filter.hpp"

namespace llpc {

bool eth_match(const eth_header& eth, const filter_params& p)
{
#pragma HLS inline
    return eth.dest == p.local_mac && eth.proto == p.ethertype;
}

bool ip_match(const ip_header& ip, const filter_params& p)
{
#pragma HLS inline
    return ip.version == 4 && ip.ihl == 5 &&
           ip.protocol == p.ip_protocol &&
           (ip.daddr & p.ip_mask) == p.ip_base;
}

bool udp_match(const udp_header& udp, const filter_params& p)
{
#pragma HLS inline
    return udp.dest == p.udp_dest_port;
}

filter_checks evaluate(const header_window& window, const filter_params& p)
{
#pragma HLS inline
    parsed_headers hdr(window);
    filter_checks c;

    c.not_eth = !eth_match(hdr.eth, p);
    c.not_ip = !ip_match(hdr.ip, p);
    c.not_udp = !udp_match(hdr.udp, p);

    return c;
}

}
