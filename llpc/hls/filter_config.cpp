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

#include "filter_config.hpp"

namespace llpc {

filter_params::filter_params() :
    local_mac(LLPC_DEFAULT_MAC),
    ethertype(LLPC_DEFAULT_ETHERTYPE),
    ip_protocol(LLPC_DEFAULT_IP_PROTOCOL),
    ip_base(LLPC_DEFAULT_IP_BASE),
    ip_mask(LLPC_DEFAULT_IP_MASK),
    udp_dest_port(LLPC_DEFAULT_UDP_PORT)
{}

std::ostream& operator<<(std::ostream& out, const filter_params& p)
{
    return out << std::hex << "filter_params(mac=" << p.local_mac
               << ", ethertype=" << p.ethertype
               << ", protocol=" << p.ip_protocol
               << ", ip=" << p.ip_base << "/" << p.ip_mask
               << ", port=" << std::dec << p.udp_dest_port << ")";
}

int filter_config::reg_write(int address, int value)
{
#pragma HLS inline
    const ap_uint<32> v = value;

    switch (address) {
    case LLPC_REG_MAC_LO:
        _params.local_mac(31, 0) = v;
        break;
    case LLPC_REG_MAC_HI:
        _params.local_mac(47, 32) = v(15, 0);
        break;
    case LLPC_REG_ETHERTYPE:
        _params.ethertype = v(15, 0);
        break;
    case LLPC_REG_IP_PROTOCOL:
        _params.ip_protocol = v(7, 0);
        break;
    case LLPC_REG_IP_BASE:
        _params.ip_base = v;
        break;
    case LLPC_REG_IP_MASK:
        _params.ip_mask = v;
        break;
    case LLPC_REG_UDP_PORT:
        _params.udp_dest_port = v(15, 0);
        break;
    default:
        return GW_FAIL;
    }

    return GW_DONE;
}

int filter_config::reg_read(int address, int* value) const
{
#pragma HLS inline
    ap_uint<32> v = 0;

    switch (address) {
    case LLPC_REG_MAC_LO:
        v = _params.local_mac(31, 0);
        break;
    case LLPC_REG_MAC_HI:
        v = _params.local_mac(47, 32);
        break;
    case LLPC_REG_ETHERTYPE:
        v = _params.ethertype;
        break;
    case LLPC_REG_IP_PROTOCOL:
        v = _params.ip_protocol;
        break;
    case LLPC_REG_IP_BASE:
        v = _params.ip_base;
        break;
    case LLPC_REG_IP_MASK:
        v = _params.ip_mask;
        break;
    case LLPC_REG_UDP_PORT:
        v = _params.udp_dest_port;
        break;
    default:
        *value = int(LLPC_REG_UNMAPPED);
        return GW_FAIL;
    }

    *value = v.to_uint();
    return GW_DONE;
}

void filter_config::write(reg_addr_t address, ap_uint<32> value)
{
    /* Writes to unmapped addresses are ignored */
    reg_write(address.to_uint(), value.to_uint());
}

ap_uint<32> filter_config::read(reg_addr_t address) const
{
    int value;

    reg_read(address.to_uint(), &value);
    return ap_uint<32>(value);
}

}
