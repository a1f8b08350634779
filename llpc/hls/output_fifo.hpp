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

#include "hls_helper.h"

#pragma once

/* A bounded FIFO over a fixed array that provides backpressure when it has
 * X elements left. Entries are stored in place; nothing is allocated after
 * construction. */
template <typename T, size_t depth = 16, size_t index_width = 1 + hls_helpers::log2(depth)>
class output_fifo
{
public:
    static_assert(depth > 0, "output FIFO needs at least one slot");

    typedef ap_uint<index_width> index_t;

    /* Backpressure is asserted once the occupancy reaches full_threshold */
    output_fifo(index_t full_threshold = depth) :
            _pi(0), _ci(0), _count(0), _full_threshold(full_threshold)
    { }

    bool write_nb(const T& t) {
#pragma HLS inline
        if (full())
            return false;
        _slots[_pi] = t;
        _pi = next(_pi);
        ++_count;
        return true;
    }

    /* Oldest entry, valid only when not empty */
    const T& front() const {
#pragma HLS inline
        return _slots[_ci];
    }

    T read() {
#pragma HLS inline
        T t = _slots[_ci];
        _ci = next(_ci);
        --_count;
        return t;
    }

    bool read_nb(T& t) {
#pragma HLS inline
        if (empty())
            return false;
        t = read();
        return true;
    }

    index_t count() const { return _count; }

    bool empty() const {
#pragma HLS inline
        return _count == 0;
    }

    bool full() const {
#pragma HLS inline
        return _count == depth;
    }

    bool almost_full() const {
#pragma HLS inline
        return _count >= _full_threshold;
    }

    void reset() {
        _pi = 0;
        _ci = 0;
        _count = 0;
    }

private:
    static index_t next(index_t i) {
#pragma HLS inline
        return i == depth - 1 ? index_t(0) : index_t(i + 1);
    }

    T _slots[depth];
    index_t _pi, _ci, _count, _full_threshold;
};
