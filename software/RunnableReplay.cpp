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

#include "RunnableReplay.hpp"
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <arpa/inet.h>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>

#include "pcap_stream.hpp"

using boost::program_options::options_description;
using boost::program_options::value;
using boost::program_options::store;
using boost::program_options::parse_command_line;

/* Cycles to wait for the gateway to complete a command */
#define GATEWAY_TIMEOUT 16

namespace {
    uint64_t parse_mac(const std::string& s)
    {
        unsigned int b[6];
        char trailing;

        if (sscanf(s.c_str(), "%x:%x:%x:%x:%x:%x%c", &b[0], &b[1], &b[2], &b[3], &b[4], &b[5],
                   &trailing) != 6)
            throw std::invalid_argument("invalid MAC address: " + s);

        uint64_t mac = 0;
        for (int i = 0; i < 6; ++i) {
            if (b[i] > 0xff)
                throw std::invalid_argument("invalid MAC address: " + s);
            mac = (mac << 8) | b[i];
        }
        return mac;
    }

    uint32_t parse_ip(const std::string& s)
    {
        struct in_addr addr;

        if (inet_pton(AF_INET, s.c_str(), &addr) != 1)
            throw std::invalid_argument("invalid IPv4 address: " + s);
        return ntohl(addr.s_addr);
    }

    uint32_t parse_number(const std::string& s)
    {
        size_t pos;
        unsigned long v = std::stoul(s, &pos, 0);

        if (pos != s.size() || v > 0xffffffffUL)
            throw std::invalid_argument("invalid number: " + s);
        return v;
    }
}

RunnableReplay::RunnableReplay(int argc, char **argv)
        : argc(argc),
          argv(argv),
          ingress("ingress"),
          egress("egress"),
          packets(0) {}

int RunnableReplay::parse_command_line_options() {
    options_description desc("options");
    desc.add_options()
            ("help,h", "print help message")
            ("input,i", value<std::string>(), "input pcap file")
            ("output,o", value<std::string>()->default_value("payload.pcap"), "output pcap file for forwarded payloads")
            ("mac,m", value<std::string>()->default_value("de:ad:be:ef:ca:fe"), "local MAC address")
            ("ethertype,e", value<std::string>()->default_value("0x0800"), "EtherType")
            ("protocol,P", value<std::string>()->default_value("17"), "IP protocol")
            ("ip-base,a", value<std::string>()->default_value("10.0.1.0"), "destination IP base address")
            ("ip-mask,M", value<std::string>()->default_value("255.255.255.252"), "destination IP mask")
            ("port,p", value<std::string>()->default_value("25565"), "UDP destination port")
            ("ready,r", value<int>()->default_value(100), "downstream ready duty cycle in percent")
            ("seed,s", value<unsigned>()->default_value(1), "random seed for the ready pattern")
            ("extra-cycles,c", value<int>()->default_value(1000), "cycles to run after the input is consumed");

    store(parse_command_line(argc, argv, desc), vm);

    if (vm.count("help") || !vm.count("input")) {
        std::cerr << desc << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

void RunnableReplay::clock(bool out_ready)
{
    llpc_top(ingress, egress, out_ready, &timing, gateway, &stats, false);

    if (timing.valid) {
        ++packets;
        std::cout << "packet " << packets << ": " << timing.timestamp << " cycles\n";
    }
}

int RunnableReplay::reg_write(uint32_t address, uint32_t value)
{
    gateway.cmd.addr = address;
    gateway.cmd.write = 1;
    gateway.data = value;
    gateway.cmd.go = 1;

    for (int i = 0; i < GATEWAY_TIMEOUT && !gateway.done; ++i)
        clock(true);
    if (!gateway.done)
        return -1;

    gateway.cmd.go = 0;
    for (int i = 0; i < GATEWAY_TIMEOUT && gateway.done; ++i)
        clock(true);
    return gateway.done ? -1 : 0;
}

int RunnableReplay::reg_read(uint32_t address, uint32_t* value)
{
    gateway.cmd.addr = address;
    gateway.cmd.write = 0;
    gateway.cmd.go = 1;

    for (int i = 0; i < GATEWAY_TIMEOUT && !gateway.done; ++i)
        clock(true);
    if (!gateway.done)
        return -1;
    *value = gateway.data;

    gateway.cmd.go = 0;
    for (int i = 0; i < GATEWAY_TIMEOUT && gateway.done; ++i)
        clock(true);
    return gateway.done ? -1 : 0;
}

void RunnableReplay::configure()
{
    const uint64_t mac = parse_mac(vm["mac"].as<std::string>());
    const struct {
        uint32_t address;
        uint32_t value;
    } regs[] = {
        { LLPC_REG_MAC_LO, uint32_t(mac) },
        { LLPC_REG_MAC_HI, uint32_t(mac >> 32) },
        { LLPC_REG_ETHERTYPE, parse_number(vm["ethertype"].as<std::string>()) },
        { LLPC_REG_IP_PROTOCOL, parse_number(vm["protocol"].as<std::string>()) },
        { LLPC_REG_IP_BASE, parse_ip(vm["ip-base"].as<std::string>()) },
        { LLPC_REG_IP_MASK, parse_ip(vm["ip-mask"].as<std::string>()) },
        { LLPC_REG_UDP_PORT, parse_number(vm["port"].as<std::string>()) },
    };

    for (auto& r : regs) {
        uint32_t readback;

        if (reg_write(r.address, r.value) || reg_read(r.address, &readback))
            throw std::runtime_error("gateway timeout");
        if (readback != r.value)
            std::cerr << "Warning: register " << r.address << " reads back 0x" << std::hex
                      << readback << " instead of 0x" << r.value << std::dec << "\n";
    }
}

int RunnableReplay::simulate()
{
    const int ready_percent = vm["ready"].as<int>();
    const int extra_cycles = vm["extra-cycles"].as<int>();
    srandom(vm["seed"].as<unsigned>());

    if (ready_percent <= 0 || ready_percent > 100)
        throw std::invalid_argument("ready duty cycle must be in (0, 100]");

    int idle = 0;
    while (idle < extra_cycles) {
        const bool out_ready = int(random() % 100) < ready_percent;
        clock(out_ready);
        idle = ingress.empty() ? idle + 1 : 0;
    }

    FILE* output = fopen(vm["output"].as<std::string>().c_str(), "w");
    if (!output) {
        perror("fopen");
        return -1;
    }

    int count = emulation::write_pcap(output, egress);
    fclose(output);
    return count;
}

int RunnableReplay::run() {
    try {
        if (parse_command_line_options() == EXIT_FAILURE) {
            return EXIT_FAILURE;
        }

        llpc_top(ingress, egress, true, &timing, gateway, &stats, true);
        configure();

        int total = emulation::read_pcap(vm["input"].as<std::string>(), ingress);
        if (total < 0)
            return EXIT_FAILURE;

        int forwarded = simulate();
        if (forwarded < 0)
            return EXIT_FAILURE;

        std::cerr << "read " << total << " packets, forwarded " << forwarded << "\n";
        std::cout << stats;
    }
    catch (std::exception &e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

RunnableReplay::~RunnableReplay() {}
