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

#include <ap_int.h>

#include "hls_helper.h"

/* AXI-Lite offsets of the gateway command, data and done registers */
#define GATEWAY_OFFSET(gateway, offset_cmd, offset_data, offset_done) \
    DO_PRAGMA_SYN(HLS interface s_axilite port=gateway.cmd offset=offset_cmd) \
    DO_PRAGMA_SYN(HLS interface s_axilite port=gateway.data offset=offset_data) \
    DO_PRAGMA_SYN(HLS interface s_axilite port=gateway.done offset=offset_done)

namespace llpc {

    enum gateway_status {
        GW_FAIL = -1,
        GW_DONE = 0,
        GW_BUSY = 1,
    };

    struct gateway_command {
        gateway_command() : addr(0), write(0), go(0) {}

        ap_uint<30> addr;
        ap_uint<1> write; // Bit 30
        ap_uint<1> go; // Bit 31
    };

    /* Host side of the gateway. data carries the value to write, or the
     * value read back once done is raised. */
    struct gateway_registers {
        gateway_registers() : cmd(), data(0), done(0) {}

        gateway_command cmd;
        int data;
        ap_uint<1> done;
    };

    /* Serves one register command per go/done handshake: the host raises go,
     * waits for done, then lowers go before issuing the next command. The
     * derived class provides reg_read() and reg_write(), returning a
     * gateway_status. A command answered with GW_BUSY is retried on the next
     * call. */
    template <typename derived>
    class register_gateway {
    public:
        register_gateway() : _command_done(false) {}

        static void gateway(derived* regs, gateway_registers& r)
        {
#pragma HLS pipeline enable_flush ii=1
        DO_PRAGMA_SYN(HLS data_pack variable=r.cmd)
            register_gateway& self = *regs;

            if (!r.cmd.go) {
                if (self._command_done) {
                    self._command_done = false;
                    r.done = 0;
                }
                return;
            }

            if (self._command_done)
                return;

            const int status = r.cmd.write ? regs->reg_write(r.cmd.addr, r.data) :
                                             regs->reg_read(r.cmd.addr, &r.data);
            if (status != GW_BUSY) {
                self._command_done = true;
                r.done = 1;
            }
        }

    protected:
        /* Abandons a command in progress; the host must lower go before
         * issuing the next one */
        void gateway_reset() { _command_done = false; }

    private:
        bool _command_done;
    };
}
