/* * Copyright (c) 2016-2017 Haggai Eran, Gabi Malka, Lior Zeno, Maroun Tork
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without modification,
 * are permitted provided that the following conditions are met:
 *
 *  * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 *  * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation and/or
 * other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS ``AS IS''
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR
 * ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON
 * ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef HLS_HELPER_H
#define HLS_HELPER_H

#include <hls_stream.h>
#include <ap_int.h>

#define PRAGMA_SUB(x) _Pragma(#x)
/* Use DO_PRAGMA to be able to have C preprocessor expansion in a pragma */
#define DO_PRAGMA(x) PRAGMA_SUB(x)

#ifdef __SYNTHESIS__
  #define DO_PRAGMA_SYN(x) DO_PRAGMA(x)
#else
  #define DO_PRAGMA_SYN(x)
#endif

namespace hls_helpers {

constexpr unsigned log2(unsigned n)
{
    return n <= 1 ? 0 : 1 + log2(n / 2);
}

/* Byte 0 is the most significant byte of the vector */
template <unsigned Width>
unsigned char get_byte(const ap_uint<Width>& vec, const int i) {
#pragma HLS inline
    const int bottom = (Width - 1) - ((i + 1) * 8 - 1), top = (Width - 1) - (i * 8);

    return vec(top, bottom);
}

template <unsigned Width>
void write_byte(ap_uint<Width>& vec, const int i, const unsigned char val) {
#pragma HLS inline
    const int bottom = (Width - 1) - ((i + 1) * 8 - 1), top = (Width - 1) - (i * 8);

    vec(top, bottom) = val;
}

/* Keep bit of byte i, with byte 0 on the most significant keep bit */
template <unsigned Bytes>
bool keep_bit(const ap_uint<Bytes>& keep, const int i) {
#pragma HLS inline
    return keep[Bytes - 1 - i];
}

/* Zero out bytes in the data vector that have their keep bit cleared */
template <unsigned Width>
ap_uint<Width> mask_bytes(const ap_uint<Width>& data, const ap_uint<Width / 8>& keep)
{
#pragma HLS inline
    const unsigned bytes = Width / 8;
    ap_uint<Width> result = 0;

    for (unsigned i = 0; i < bytes; ++i) {
#pragma HLS unroll
        if (keep_bit<bytes>(keep, i))
            write_byte<Width>(result, i, get_byte<Width>(data, i));
    }

    return result;
}

} // namespace

#endif // HLS_HELPER_H
