/**
 * @file test-discover/main.cpp
 * @brief Live check of discovery plumbing on the current host.
 *
 * Two subcommands:
 * @code
 *   ./akka-discover ifaces                 # interface table + chosen broadcast targets
 *   ./akka-discover probe --wait 2000      # one broadcast round, print every reply
 * @endcode
 *
 * `probe` bypasses DiscoveryEngine on purpose: it shows raw replies, echoes and
 * all, so a misbehaving server is visible as-is.
 */

#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "CLI/CLI11.hpp"
#include "akka/broadcast_target.hpp"
#include "akka/discovery_reply.hpp"
#include "net_interfaces.hpp"
#include "udp_io.hpp"

using namespace akka;

static void print_interfaces() {
    std::cout << "Interfaces:\n";
    auto ifaces = list_ipv4_interfaces();
    if (ifaces.empty()) std::cout << "  (none)\n";
    for (const auto& i : ifaces) {
        std::cout << "  " << i.name
                  << " ip=" << format_ipv4(i.ip).c_str()
                  << " mask=" << format_ipv4(i.netmask).c_str()
                  << (i.up ? " up" : " down")
                  << (i.loopback ? " loopback" : "")
                  << (i.broadcast_capable ? " broadcast" : "") << "\n";
    }

    std::cout << "\nTargets:\n";
    auto targets = select_broadcast_targets(ifaces);
    if (targets.empty()) std::cout << "  (none)\n";
    for (const auto& t : targets) {
        std::cout << "  " << t.interface_name << " -> " << t.broadcast_address.c_str() << "\n";
    }
}

static int probe(uint16_t port, int wait_ms) {
    int fd = open_udp_socket(0, true);
    if (fd < 0) {
        std::cerr << "cannot open broadcast socket\n";
        return 1;
    }

    const auto* magic = reinterpret_cast<const uint8_t*>(discovery::MAGIC);
    for (const auto& t : list_broadcast_targets()) {
        auto ip = parse_ipv4(t.broadcast_address.c_str());
        if (!ip) continue;
        bool ok = send_datagram(fd, *ip, port, magic, discovery::MAGIC_LEN);
        std::cout << "sent " << t.interface_name << " -> " << t.broadcast_address.c_str()
                  << (ok ? "" : " (failed)") << "\n";
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(wait_ms);
    std::vector<uint8_t> buf;
    int replies = 0;
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) break;

        uint32_t from = 0;
        int n = read_datagram(fd, buf, static_cast<int>(left), &from);
        if (n < 0) { std::cerr << "receive failed\n"; break; }
        if (n == 0) continue;

        std::string text(buf.begin(), buf.end());
        std::cout << "from " << format_ipv4(from).c_str() << ": " << text;
        if (discovery::is_echo(buf.data(), buf.size())) {
            std::cout << "  [echo]\n";
            continue;
        }
        auto addr = discovery::parse_server_reply(text);
        if (addr) {
            std::cout << "  [server " << addr->c_str() << "]\n";
            ++replies;
        } else {
            std::cout << "  [ignored]\n";
        }
    }
    close_socket(fd);

    std::cout << replies << " server repl" << (replies == 1 ? "y" : "ies") << "\n";
    return replies > 0 ? 0 : 2;
}

int main(int argc, char** argv) {
    CLI::App app{"akka discovery harness"};
    app.require_subcommand(1);

    auto* ifaces = app.add_subcommand("ifaces", "List interfaces and broadcast targets");

    uint16_t port = discovery::DEFAULT_PORT;
    int wait_ms = 2000;
    auto* pr = app.add_subcommand("probe", "Broadcast once and print replies");
    pr->add_option("--port", port, "Discovery port");
    pr->add_option("--wait", wait_ms, "Listen time in ms")->check(CLI::Range(1, 60000));

    CLI11_PARSE(app, argc, argv);

    if (ifaces->parsed()) {
        print_interfaces();
        return 0;
    }
    return probe(port, wait_ms);
}
