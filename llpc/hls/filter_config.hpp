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

#ifndef LLPC_FILTER_CONFIG_HPP
#define LLPC_FILTER_CONFIG_HPP

#include <ap_int.h>
#include <ostream>

#include "gateway.hpp"

#define LLPC_REG_MAC_LO 0x0
#define LLPC_REG_MAC_HI 0x1
#define LLPC_REG_ETHERTYPE 0x2
#define LLPC_REG_IP_PROTOCOL 0x3
#define LLPC_REG_IP_BASE 0x4
#define LLPC_REG_IP_MASK 0x5
#define LLPC_REG_UDP_PORT 0x6

/* Value read from an unmapped address */
#define LLPC_REG_UNMAPPED 0xffffffff

#define LLPC_DEFAULT_MAC 0xdeadbeefcafeull
#define LLPC_DEFAULT_ETHERTYPE 0x0800 // ETH_P_IP
#define LLPC_DEFAULT_IP_PROTOCOL 0x11 // IPPROTO_UDP
#define LLPC_DEFAULT_IP_BASE 0x0a000100 // 10.0.1.0
#define LLPC_DEFAULT_IP_MASK 0xfffffffc // /30
#define LLPC_DEFAULT_UDP_PORT 25565

namespace llpc {

    typedef ap_uint<4> reg_addr_t;

    /* Match parameters of the filter evaluator */
    struct filter_params {
        ap_uint<48> local_mac;
        ap_uint<16> ethertype;
        ap_uint<8> ip_protocol;
        ap_uint<32> ip_base;
        ap_uint<32> ip_mask;
        ap_uint<16> udp_dest_port;

        filter_params();
    };

    std::ostream& operator<<(std::ostream& out, const filter_params& p);

    /* Address-mapped store of the filter parameters, written by an external
     * configurator between cycles and read by the parser every cycle.
     *
     * A write served by the gateway in one cycle is seen by the header
     * evaluation of the following cycle. Each register write is applied on
     * its own. A reconfiguration spanning several registers is not atomic:
     * packets evaluated between the writes see a mix of old and new fields. */
    class filter_config : public register_gateway<filter_config> {
    public:
        filter_config() : _params() {}

        int reg_write(int address, int value);
        int reg_read(int address, int* value) const;

        void write(reg_addr_t address, ap_uint<32> value);
        ap_uint<32> read(reg_addr_t address) const;

        const filter_params& params() const { return _params; }
        void reset()
        {
            _params = filter_params();
            gateway_reset();
        }

    private:
        filter_params _params;
    };
}

#endif // LLPC_FILTER_CONFIG_HPP
