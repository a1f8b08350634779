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

#include <ostream>
#include <boost/operators.hpp>

#include "hls_helper.h"
#include "llpc.h"

namespace llpc {

    typedef ap_uint<LLPC_BEAT_WIDTH_BITS> word;
    typedef ap_uint<LLPC_BEAT_WIDTH_BYTES> keep_t;

    /* One beat of the ingress or egress stream. Byte 0 is data(255, 248) and
     * its keep bit is keep[31]. On ingress the keep mask must be a contiguous
     * run starting at byte 0. */
    struct stream_beat : public boost::equality_comparable<stream_beat> {
        word data;
        keep_t keep;
        ap_uint<1> valid;
        ap_uint<1> last;

        stream_beat() : data(0), keep(0), valid(0), last(0) {}
        stream_beat(const word& data, const keep_t& keep, bool last) :
            data(data), keep(keep), valid(1), last(last) {}

        /* Keep mask for the first valid_bytes bytes of a beat */
        static keep_t keep_bytes(unsigned valid_bytes)
        {
            if (valid_bytes >= LLPC_BEAT_WIDTH_BYTES)
                return ~keep_t(0);
            return ~keep_t(0) ^ ((keep_t(1) << (LLPC_BEAT_WIDTH_BYTES - valid_bytes)) - 1);
        }

        bool full() const { return keep.and_reduce(); }

        void set_data(const char *d, unsigned valid_bytes)
        {
            keep = keep_bytes(valid_bytes);
            for (unsigned byte = 0; byte < LLPC_BEAT_WIDTH_BYTES; ++byte) {
#pragma HLS unroll
                const char data_word = (byte < valid_bytes) ? d[byte] : 0;
                hls_helpers::write_byte<LLPC_BEAT_WIDTH_BITS>(data, byte, data_word);
            }
        }

        /* Copy out the bytes under the keep mask, returns their number. Unlike
         * ingress beats, the first payload beat on egress has a keep mask
         * that does not start at byte 0. */
        unsigned get_data(char *d) const
        {
            unsigned count = 0;
            for (unsigned byte = 0; byte < LLPC_BEAT_WIDTH_BYTES; ++byte) {
                if (hls_helpers::keep_bit<LLPC_BEAT_WIDTH_BYTES>(keep, byte))
                    d[count++] = hls_helpers::get_byte<LLPC_BEAT_WIDTH_BITS>(data, byte);
            }

            return count;
        }

        bool operator ==(const stream_beat& other) const
        {
            return valid == other.valid &&
                (!valid || (data == other.data && keep == other.keep && last == other.last));
        }
    };

    static inline std::ostream& operator <<(std::ostream& out, const stream_beat& b)
    {
        if (!b.valid)
            return out << "stream_beat(invalid)";
        return out << "stream_beat(" << std::hex << b.data << ", keep=" << b.keep << std::dec
                   << (b.last ? ", last)" : ")");
    }

    typedef hls::stream<stream_beat> beat_stream;
}
