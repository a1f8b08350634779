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

#ifndef LLPC_BEAT_HISTORY
#define LLPC_BEAT_HISTORY

#include "hls_helper.h"
#include "stream_beat.hpp"

namespace llpc {

/* Snapshots of the last depth admitted beats. at(0) is the newest beat and
 * at(depth - 1) the oldest; slots not yet written hold invalid beats. */
template <unsigned depth>
class beat_history
{
public:
    static_assert(depth > 0, "beat history needs at least one slot");

    beat_history() : _head(0) {}

    void push(const stream_beat& b)
    {
#pragma HLS inline
        _head = _head == depth - 1 ? 0 : _head + 1;
        _beats[_head] = b;
    }

    const stream_beat& at(unsigned lookback) const
    {
#pragma HLS inline
        const unsigned index = _head >= lookback ? _head - lookback : _head + depth - lookback;
        return _beats[index];
    }

    void reset()
    {
        for (unsigned i = 0; i < depth; ++i)
#pragma HLS unroll
            _beats[i] = stream_beat();
        _head = 0;
    }

    static const unsigned size = depth;

protected:
    stream_beat _beats[depth];
    unsigned _head;
};

}

#endif
