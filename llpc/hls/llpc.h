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

#ifndef LLPC_H
#define LLPC_H

#define LLPC_BEAT_WIDTH_BITS 256
#define LLPC_BEAT_WIDTH_BYTES (LLPC_BEAT_WIDTH_BITS / 8)
#define LLPC_WINDOW_WIDTH_BITS (2 * LLPC_BEAT_WIDTH_BITS)

/* Ethernet + IPv4 without options + UDP */
#define LLPC_HEADER_BYTES 42
/* Header bytes that spill into the second beat of a packet */
#define LLPC_HEADER_TAIL_BYTES (LLPC_HEADER_BYTES - LLPC_BEAT_WIDTH_BYTES)

/* Cycles between ingress admission and the egress mux: the ingress staging
 * register and the payload register */
#define LLPC_PIPELINE_DEPTH 2
/* Cycles between admission of a beat and its observation by the parser */
#define LLPC_TIMESTAMP_LATENCY 1
/* Admitted beats kept for the header window (beat N and N-1) */
#define LLPC_HISTORY_DEPTH 2

#define LLPC_FIFO_DEPTH 16 // A single SRL
#define LLPC_TIMESTAMP_WIDTH 32

#endif // LLPC_H
