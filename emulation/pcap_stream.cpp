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

#include <pcap/pcap.h>
#include <algorithm>
#include <iostream>
#include <string>
#include <unistd.h>
#include <boost/lexical_cast.hpp>

#include "pcap_stream.hpp"

using std::string;
using boost::lexical_cast;

namespace emulation {

struct packet_handler_context {
    llpc::beat_stream& stream;
    int count;
    int range_start;
    int range_end;

    explicit packet_handler_context(llpc::beat_stream& stream) :
        stream(stream), count(0), range_start(0), range_end(0) {}
};

void write_packet(const unsigned char *bytes, unsigned len, llpc::beat_stream& stream)
{
    const unsigned b = LLPC_BEAT_WIDTH_BYTES;

    for (unsigned word = 0; word < len; word += b) {
        llpc::stream_beat input;
        input.set_data(reinterpret_cast<const char *>(bytes + word), std::min(b, len - word));
        input.valid = 1;
        input.last = (word + b) >= len;
        stream.write(input);
    }
}

static void packet_handler(u_char *user, const struct pcap_pkthdr *h, const u_char *bytes)
{
    auto context = reinterpret_cast<packet_handler_context*>(user);

    if (h->caplen == h->len &&
        context->count >= context->range_start && context->count < context->range_end)
        write_packet(bytes, h->len, context->stream);

    ++context->count;
}

int read_pcap(const string& filename, llpc::beat_stream& stream,
              int range_start, int range_end)
{
    char errbuf[PCAP_ERRBUF_SIZE];
    pcap_t *file = pcap_open_offline(filename.c_str(), errbuf);

    if (!file) {
        fprintf(stderr, "%s\n", errbuf);
        return -1;
    }

    packet_handler_context context(stream);
    context.range_start = range_start;
    context.range_end = range_end;
    int ret = pcap_loop(file, 0, &packet_handler, (u_char *)&context);
    if (ret == -1) {
        fprintf(stderr, "pcap_loop returned error: %s\n", pcap_geterr(file));
        pcap_close(file);
        return -1;
    }

    pcap_close(file);

    return context.count;
}

int write_pcap(FILE* file, llpc::beat_stream& stream)
{
    int ret;
    int count = 0;

    pcap_t *dead = pcap_open_dead(DLT_EN10MB, 65535);
    if (!dead) {
        perror("pcap_open_dead failed");
        return -1;
    }

    pcap_dumper_t *output = pcap_dump_fopen(dead, file);
    if (!output) {
        fprintf(stderr, "pcap_dump_fopen failed: %s\n", pcap_geterr(dead));
        pcap_close(dead);
        return -1;
    }

    static u_char buffer[65535 + LLPC_BEAT_WIDTH_BYTES];
    pcap_pkthdr h = {};
    h.len = 0;

    while (!stream.empty()) {
        llpc::stream_beat w = stream.read();

        if (h.len <= 65535)
            h.len += w.get_data(reinterpret_cast<char *>(buffer + h.len));
        if (w.last) {
            h.caplen = h.len;
            pcap_dump((u_char *)output, &h, buffer);
            ++count;
            h.len = 0;
        }
    }

    if (h.len)
        std::cerr << "Warning: incomplete packet of " << h.len << " bytes at end of stream\n";

    ret = pcap_dump_flush(output);
    if (ret) {
        perror("pcap_dump_flush returned error");
        pcap_close(dead);
        return -1;
    }

    pcap_close(dead);
    fdatasync(fileno(file));

    return count;
}

string filename(FILE* file)
{
    return "/proc/self/fd/" + lexical_cast<string>(fileno(file));
}

}
