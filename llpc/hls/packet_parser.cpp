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

#include "packet_parser.hpp"

namespace llpc {

std::ostream& operator<<(std::ostream& out, parser_state s)
{
    switch (s) {
    case IDLE:
        return out << "IDLE";
    case PARSE_HEADER:
        return out << "PARSE_HEADER";
    case STREAM_PAYLOAD:
        return out << "STREAM_PAYLOAD";
    }
    return out << "parser_state(" << int(s) << ")";
}

std::ostream& operator<<(std::ostream& out, const parser_stats& s)
{
    return out << "packets admitted:    " << s.packets_admitted << "\n"
               << "packets passed:      " << s.packets_passed << "\n"
               << "first beat rejected: " << s.first_beat_rejected << "\n"
               << "dropped truncated:   " << s.drop_truncated << "\n"
               << "dropped by filter:   " << s.drop_filter
               << " (eth " << s.filter_not_eth
               << ", ip " << s.filter_not_ip
               << ", udp " << s.filter_not_udp << ")\n"
               << "beats bypassed:      " << s.beats_bypassed << "\n"
               << "beats buffered:      " << s.beats_buffered << "\n"
               << "fifo overflow:       " << s.fifo_overflow << "\n";
}

}
