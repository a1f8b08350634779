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

#ifndef LLPC_RUNNABLEREPLAY_HPP
#define LLPC_RUNNABLEREPLAY_HPP

#include <cstdint>
#include <string>
#include <boost/program_options/variables_map.hpp>

#include "llpc-top.hpp"

using boost::program_options::variables_map;

/* Replays a capture file through the cycle simulation of the classifier and
 * writes the forwarded payloads to another capture file. */
class RunnableReplay {
public:
    RunnableReplay(int argc, char** argv);
    virtual ~RunnableReplay();
    virtual int run();
    virtual int parse_command_line_options();

protected:
    /* Program the filter registers through the gateway */
    void configure();
    int reg_write(uint32_t address, uint32_t value);
    int reg_read(uint32_t address, uint32_t* value);
    /* One cycle of the top function */
    void clock(bool out_ready);
    int simulate();

    variables_map vm;
    int argc;
    char** argv;

    llpc::beat_stream ingress;
    llpc::beat_stream egress;
    llpc::gateway_registers gateway;
    llpc_timing timing;
    llpc::parser_stats stats;
    unsigned long long packets;
};

#endif //LLPC_RUNNABLEREPLAY_HPP
