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

#ifndef LLPC_FILTER_HPP
#define LLPC_FILTER_HPP

#include "headers.hpp"
#include "filter_config.hpp"

namespace llpc {

    /* Per-layer results of the header filter. A layer flag is set when that
     * layer does not match the configuration. */
    struct filter_checks {
        bool not_eth;
        bool not_ip;
        bool not_udp;

        filter_checks() : not_eth(false), not_ip(false), not_udp(false) {}

        bool pass() const { return !not_eth && !not_ip && !not_udp; }
    };

    bool eth_match(const eth_header& eth, const filter_params& p);
    /* IPv4 with a 20 byte header only: packets with IP options are rejected */
    bool ip_match(const ip_header& ip, const filter_params& p);
    bool udp_match(const udp_header& udp, const filter_params& p);

    /* Stateless: depends only on the window and the parameters */
    filter_checks evaluate(const header_window& window, const filter_params& p);

    static inline bool filters_valid(const header_window& window, const filter_params& p)
    {
        return evaluate(window, p).pass();
    }
}

#endif // LLPC_FILTER_HPP
