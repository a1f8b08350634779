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

#include "packet_parser.hpp"

namespace llpc {

template <size_t fifo_depth>
packet_parser<fifo_depth>::packet_parser() :
    _state(IDLE), _sop(true), _start_cycle(0),
    _stage1(), _payload(), _history(),
    _fifo(fifo_depth - LLPC_PIPELINE_DEPTH),
    _clock(), _stats()
{}

template <size_t fifo_depth>
void packet_parser<fifo_depth>::reset()
{
    _state = IDLE;
    _sop = true;
    _start_cycle = 0;
    _stage1 = stream_beat();
    _payload = stream_beat();
    _history.reset();
    _fifo.reset();
    _clock.reset();
    _stats = parser_stats();
}

template <size_t fifo_depth>
bool packet_parser<fifo_depth>::in_ready(bool out_ready) const
{
#pragma HLS inline
    /* Bypass while the buffer is empty and downstream is ready, otherwise
     * the buffer takes the beat. The almost full threshold leaves room for
     * the beats held in the pipeline registers. */
    return (_fifo.empty() && out_ready) || !_fifo.almost_full();
}

template <size_t fifo_depth>
bool packet_parser<fifo_depth>::buffer_valid(const stream_beat& first, const stream_beat& second)
{
#pragma HLS inline
    return first.valid && second.valid && first.full();
}

template <size_t fifo_depth>
bool packet_parser<fifo_depth>::header_complete(const stream_beat& second)
{
#pragma HLS inline
    const ap_uint<LLPC_HEADER_TAIL_BYTES> tail_keep =
        second.keep(LLPC_BEAT_WIDTH_BYTES - 1, LLPC_BEAT_WIDTH_BYTES - LLPC_HEADER_TAIL_BYTES);
    return tail_keep.and_reduce();
}

template <size_t fifo_depth>
stream_beat packet_parser<fifo_depth>::first_payload_beat(const stream_beat& second)
{
#pragma HLS inline
    stream_beat b;
    const keep_t header_keep = stream_beat::keep_bytes(LLPC_HEADER_TAIL_BYTES);

    b.keep = second.keep & ~header_keep;
    b.data = hls_helpers::mask_bytes<LLPC_BEAT_WIDTH_BITS>(second.data, b.keep);
    b.valid = 1;
    b.last = second.last;
    return b;
}

template <size_t fifo_depth>
void packet_parser<fifo_depth>::egress_mux(bool out_ready, stream_beat& out)
{
#pragma HLS inline
    out = stream_beat();

    if (!_fifo.empty()) {
        if (out_ready)
            out = _fifo.read();
    } else if (_payload.valid && out_ready) {
        out = _payload;
        ++_stats.beats_bypassed;
        return;
    }

    if (!_payload.valid)
        return;

    if (_fifo.write_nb(_payload))
        ++_stats.beats_buffered;
    else
        ++_stats.fifo_overflow;
}

template <size_t fifo_depth>
void packet_parser<fifo_depth>::drop(const filter_checks& c, bool truncated)
{
#pragma HLS inline
    if (truncated) {
        ++_stats.drop_truncated;
        return;
    }

    ++_stats.drop_filter;
    if (c.not_eth)
        ++_stats.filter_not_eth;
    if (c.not_ip)
        ++_stats.filter_not_ip;
    if (c.not_udp)
        ++_stats.filter_not_udp;
}

template <size_t fifo_depth>
void packet_parser<fifo_depth>::finish(timestamp_t& timestamp)
{
#pragma HLS inline
    timestamp = make_maybe(cycle_counter::elapsed(_start_cycle, _clock.now(),
                                                  LLPC_TIMESTAMP_LATENCY));
    ++_stats.packets_passed;
    _state = IDLE;
}

template <size_t fifo_depth>
stream_beat packet_parser<fifo_depth>::parse(const stream_beat& b, const filter_params& p,
                                             timestamp_t& timestamp)
{
#pragma HLS inline
    stream_beat payload;

    if (!b.valid)
        return payload;

    _history.push(b);
    const bool sop = _sop;
    _sop = b.last;

    switch (_state) {
    case IDLE:
        /* Rest of a dropped packet */
        if (!sop)
            break;

        if (b.full() && !b.last) {
            _start_cycle = _clock.now();
            _state = PARSE_HEADER;
            ++_stats.packets_admitted;
        } else {
            ++_stats.first_beat_rejected;
        }
        break;

    case PARSE_HEADER: {
        const stream_beat& first = _history.at(1);
        const header_window window = make_window(first.data, b.data);
        const filter_checks c = evaluate(window, p);
        const bool window_valid = buffer_valid(first, b) && header_complete(b);
        const bool header_valid = c.pass() && window_valid;

        if (!header_valid) {
            drop(c, !window_valid);
            _state = IDLE;
            break;
        }

        payload = first_payload_beat(b);
        if (b.last)
            finish(timestamp);
        else
            _state = STREAM_PAYLOAD;
        break;
    }

    case STREAM_PAYLOAD:
        payload = b;
        if (b.last)
            finish(timestamp);
        break;
    }

    return payload;
}

template <size_t fifo_depth>
void packet_parser<fifo_depth>::step(const stream_beat& in, bool out_ready, const filter_params& p,
                                     stream_beat& out, timestamp_t& timestamp)
{
#pragma HLS pipeline ii=1
    const bool ready = in_ready(out_ready);

    timestamp = timestamp_t();
    egress_mux(out_ready, out);
    _payload = parse(_stage1, p, timestamp);
    _stage1 = (in.valid && ready) ? in : stream_beat();
    _clock.tick();
}

}
