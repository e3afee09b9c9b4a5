//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for the DHCP server state machine

#include <catch2/catch.hpp>
#include <hal_posix/lease_file.h>
#include <hal_test/sim_utils.h>
#include <leasecat/dhcp_server.h>

using leasecat::datetime::ONE_SECOND;
using leasecat::dhcp::Lease;
using leasecat::dhcp::LeaseFile;
using leasecat::dhcp::Message;
using leasecat::dhcp::Option;
using leasecat::dhcp::Params;
using leasecat::dhcp::Reply;
using leasecat::dhcp::Server;
using leasecat::eth::MacAddr;
using leasecat::ip::Addr;
using leasecat::ip::ADDR_NONE;
using leasecat::test::client_mac;
using leasecat::test::MockClock;
using leasecat::test::MockRequest;
using leasecat::test::read_file;
using leasecat::test::sim_filename;
using leasecat::test::write_file;
namespace dhcp = leasecat::dhcp;

// Deliver a client message to the server.
// Returns true if the server wants to send a reply.
static bool deliver(Server& server, const MockRequest& req, Reply& reply) {
    Message msg;
    REQUIRE(req.decode(msg));
    return server.handle(msg, reply);
}

// Fetch the tag of the Nth option in a reply.
static u8 option_tag(const Reply& reply, unsigned idx) {
    const Option* opt = reply.options().at(idx);
    return opt ? opt->tag : 0;
}

TEST_CASE("dhcp-server") {
    // Simulation infrastructure.
    LEASECAT_TEST_START;
    log.disable();
    MockClock clock;

    // Network parameters for the unit under test.
    const Addr IP_SERVER(10, 0, 0, 1);
    const Addr IP_OTHER(10, 0, 0, 2);
    const Addr IP_DNS2(8, 8, 8, 8);
    const Addr POOL_START(10, 0, 0, 10);
    const Addr POOL_END(10, 0, 0, 20);
    const MacAddr MAC_A = client_mac(1);
    const MacAddr MAC_B = client_mac(2);
    Params params;
    params.server       = IP_SERVER;
    params.netmask      = leasecat::ip::Mask(255, 255, 255, 0);
    params.gateway      = IP_SERVER;
    params.dns_count    = 2;
    params.dns[0]       = IP_SERVER;
    params.dns[1]       = IP_DNS2;
    params.lease_secs   = 3600;

    // Unit under test, with a file-backed lease table.
    const std::string filename = sim_filename("server", "txt");
    LeaseFile leases(&clock, POOL_START, POOL_END, filename.c_str());
    Server uut(params, &leases);
    Reply reply;

    SECTION("lease-cycle") {
        // Discover -> Offer for an address in the pool.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(reply.type() == dhcp::DHCP_OFFER);
        Addr offer = reply.target();
        CHECK(leases.contains(offer));
        CHECK(reply.client() == ADDR_NONE);
        CHECK(leases.count() == 0);         // Offer does not reserve

        // Offer carries the standard option set, in order.
        REQUIRE(reply.options().count() == 5);
        CHECK(option_tag(reply, 0) == dhcp::OPTION_SERVER_ID);
        CHECK(option_tag(reply, 1) == dhcp::OPTION_LEASE_TIME);
        CHECK(option_tag(reply, 2) == dhcp::OPTION_SUBNET_MASK);
        CHECK(option_tag(reply, 3) == dhcp::OPTION_ROUTER);
        CHECK(option_tag(reply, 4) == dhcp::OPTION_DNS_SERVER);
        u32 secs = 0;
        Addr addr;
        CHECK(reply.options().find(dhcp::OPTION_LEASE_TIME)->as_u32(secs));
        CHECK(secs == 3600);
        CHECK(reply.options().find(dhcp::OPTION_SUBNET_MASK)->as_addr(addr));
        CHECK(addr == Addr(255, 255, 255, 0));
        CHECK(reply.options().find(dhcp::OPTION_SERVER_ID)->as_addr(addr));
        CHECK(addr == IP_SERVER);
        const Option* dns = reply.options().find(dhcp::OPTION_DNS_SERVER);
        CHECK(dns->addr_count() == 2);
        CHECK(dns->addr_at(1) == IP_DNS2);

        // Request -> Ack for the same address, persisted to file.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .requested_ip(offer).server_id(IP_SERVER), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(reply.target() == offer);
        CHECK(reply.options().count() == 5);
        const Lease* lease = leases.lookup(offer);
        REQUIRE(lease);
        CHECK(lease->mac == MAC_A);
        CHECK(lease->expiry == clock.now() + 3600 * ONE_SECOND);
        std::string text = read_file(filename);
        std::string line = leasecat::log::format(offer) + " AA:BB:CC:DD:EE:01";
        CHECK(text.find(line) != std::string::npos);

        // Release -> No reply, lease removed from table and file.
        CHECK_FALSE(deliver(uut, MockRequest(dhcp::DHCP_RELEASE, MAC_A)
            .ciaddr(offer).server_id(IP_SERVER), reply));
        CHECK(leases.count() == 0);
        CHECK_FALSE(leases.lookup(offer));
        text = read_file(filename);
        CHECK(text.find(line) == std::string::npos);
    }

    SECTION("discover-idempotent") {
        // Repeated Discover without a Request gets the same address.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        Addr first = reply.target();
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(reply.target() == first);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(reply.target() == first);
        CHECK(leases.count() == 0);
        // Another client is offered something else.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_B), reply));
        CHECK(reply.target() != first);
        // Once that client claims it, the first client moves on.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_B)
            .requested_ip(first), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(reply.target() != first);
        Addr second = reply.target();
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(reply.target() == second);
    }

    SECTION("discover-existing") {
        // Client with an existing lease is offered that address.
        leases.insert(Addr(10, 0, 0, 17), MAC_A, clock.now() + 1000);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(reply.target() == Addr(10, 0, 0, 17));
        // Even after it expires.
        clock.advance(5000);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(reply.target() == Addr(10, 0, 0, 17));
    }

    SECTION("contention") {
        const Addr IP_REQ(10, 0, 0, 15);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .requested_ip(IP_REQ), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(reply.target() == IP_REQ);

        // Second client asks for the same address.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_B)
            .requested_ip(IP_REQ), reply));
        CHECK(reply.type() == dhcp::DHCP_NAK);
        CHECK(reply.target() == ADDR_NONE);
        CHECK(log.contains("Nak"));

        // Nak carries only the server ID and a reason string.
        REQUIRE(reply.options().count() == 2);
        CHECK(option_tag(reply, 0) == dhcp::OPTION_SERVER_ID);
        CHECK(option_tag(reply, 1) == dhcp::OPTION_MESSAGE);
        char why[64];
        reply.options().find(dhcp::OPTION_MESSAGE)->as_text(sizeof(why), why);
        CHECK(std::string(why) == "Requested IP not available");

        // Store still shows the first client as holder.
        REQUIRE(leases.lookup(IP_REQ));
        CHECK(leases.lookup(IP_REQ)->mac == MAC_A);
    }

    SECTION("request-expired") {
        // Expired leases may be claimed by another client.
        leases.insert(Addr(10, 0, 0, 16), MAC_A, clock.now() + 1000);
        clock.advance(1001);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_B)
            .requested_ip(Addr(10, 0, 0, 16)), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(leases.lookup(Addr(10, 0, 0, 16))->mac == MAC_B);
    }

    SECTION("request-ciaddr") {
        // Without option 50, the requested address is CIADDR.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .ciaddr(Addr(10, 0, 0, 12)), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(reply.target() == Addr(10, 0, 0, 12));
        // Option 50 takes precedence when both are present.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_B)
            .ciaddr(Addr(10, 0, 0, 12)).requested_ip(Addr(10, 0, 0, 13)), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(reply.target() == Addr(10, 0, 0, 13));
    }

    SECTION("request-outside") {
        // Addresses outside the pool are refused.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .requested_ip(Addr(192, 168, 1, 42)), reply));
        CHECK(reply.type() == dhcp::DHCP_NAK);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_A), reply));
        CHECK(reply.type() == dhcp::DHCP_NAK);
        CHECK(reply.client() == ADDR_NONE);
        CHECK(leases.count() == 0);
    }

    SECTION("request-reaffirm") {
        // Existing holder is re-acked at its current address, whatever
        // address it asked for.
        leases.insert(Addr(10, 0, 0, 11), MAC_A, clock.now() + 1000);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .requested_ip(Addr(10, 0, 0, 18)), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(reply.target() == Addr(10, 0, 0, 11));
        CHECK(leases.count() == 1);
        CHECK_FALSE(leases.lookup(Addr(10, 0, 0, 18)));
    }

    SECTION("renewal") {
        // Bind the client, then renew most of the way through the lease.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .requested_ip(POOL_START), reply));
        REQUIRE(reply.type() == dhcp::DHCP_ACK);
        s64 first = leases.lookup(POOL_START)->expiry;
        clock.advance(3000 * ONE_SECOND);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .ciaddr(POOL_START), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(reply.target() == POOL_START);
        CHECK(reply.client() == POOL_START);
        REQUIRE(leases.lookup(POOL_START));
        CHECK(leases.lookup(POOL_START)->expiry > first);
        CHECK(leases.lookup(POOL_START)->expiry == clock.now() + 3600 * ONE_SECOND);
        // Past the original expiry, the address still belongs to the client.
        clock.advance(1000 * ONE_SECOND);
        CHECK(clock.now() > first);
        CHECK_FALSE(leases.available(MAC_B, POOL_START));
    }

    SECTION("renewal-static") {
        // Renewal never shortens a permanent reservation.
        s64 expiry = clock.now() + leasecat::dhcp::LEASE_STATIC;
        leases.insert(Addr(10, 0, 0, 14), MAC_A, expiry);
        clock.advance(60 * ONE_SECOND);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .ciaddr(Addr(10, 0, 0, 14)), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(reply.target() == Addr(10, 0, 0, 14));
        CHECK(leases.lookup(Addr(10, 0, 0, 14))->expiry == expiry);
    }

    SECTION("renewal-single") {
        // With a single address, a renewed lease is not offered to others.
        const std::string fname = sim_filename("server_single", "txt");
        LeaseFile single(&clock, POOL_START, POOL_START + 1, fname.c_str());
        Server uut1(params, &single);
        REQUIRE(deliver(uut1, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(reply.target() == POOL_START);
        REQUIRE(deliver(uut1, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .requested_ip(POOL_START), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        clock.advance(3000 * ONE_SECOND);
        REQUIRE(deliver(uut1, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .ciaddr(POOL_START), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        clock.advance(960 * ONE_SECOND);
        CHECK_FALSE(deliver(uut1, MockRequest(dhcp::DHCP_DISCOVER, MAC_B), reply));
        CHECK(log.contains("Pool exhausted"));
        // The renewed lease was also written to the file.
        std::string line = leasecat::log::format(POOL_START) + " AA:BB:CC:DD:EE:01";
        CHECK(read_file(fname).find(line) != std::string::npos);
    }

    SECTION("decline") {
        leases.insert(Addr(10, 0, 0, 11), MAC_A, clock.now() + 1000);
        CHECK_FALSE(deliver(uut, MockRequest(dhcp::DHCP_DECLINE, MAC_A), reply));
        CHECK(leases.count() == 0);
    }

    SECTION("release-unknown") {
        // Release from a client with no lease changes nothing.
        leases.insert(Addr(10, 0, 0, 11), MAC_A, clock.now() + 1000);
        CHECK_FALSE(deliver(uut, MockRequest(dhcp::DHCP_RELEASE, MAC_B), reply));
        CHECK(leases.count() == 1);
    }

    SECTION("exhausted") {
        // Fill the pool, then ask for one more.
        for (unsigned a = 0 ; a < 10 ; ++a)
            leases.insert(POOL_START + a, client_mac(u8(100 + a)), clock.now() + 1000);
        CHECK_FALSE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(log.contains("Pool exhausted"));
    }

    SECTION("static-override") {
        // Permanent reservation for client M, then fill the rest of the pool.
        const MacAddr MAC_M = {{0x02, 0x00, 0x00, 0x00, 0x00, 0x4D}};
        const std::string statics = sim_filename("server_static", "csv");
        REQUIRE(write_file(statics, "02:00:00:00:00:4D,10.0.0.10\n"));
        CHECK(leases.load_static(statics.c_str()) == 1);
        for (unsigned a = 1 ; a < 10 ; ++a) {
            REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, client_mac(u8(a))), reply));
            Addr offer = reply.target();
            CHECK(offer != POOL_START);
            REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, client_mac(u8(a)))
                .requested_ip(offer), reply));
            CHECK(reply.type() == dhcp::DHCP_ACK);
        }
        CHECK(leases.count() == 10);
        CHECK_FALSE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, client_mac(42)), reply));

        // Client M still gets its reservation.
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_M), reply));
        CHECK(reply.type() == dhcp::DHCP_OFFER);
        CHECK(reply.target() == POOL_START);
        REQUIRE(deliver(uut, MockRequest(dhcp::DHCP_REQUEST, MAC_M)
            .requested_ip(POOL_START), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(reply.target() == POOL_START);
    }

    SECTION("ignored") {
        // Inform is not supported.
        CHECK_FALSE(deliver(uut, MockRequest(dhcp::DHCP_INFORM, MAC_A), reply));
        // Server-to-client message types are ignored.
        CHECK_FALSE(deliver(uut, MockRequest(dhcp::DHCP_OFFER, MAC_A), reply));
        CHECK_FALSE(deliver(uut, MockRequest(dhcp::DHCP_ACK, MAC_A), reply));
        // Replies from another server are ignored.
        CHECK_FALSE(deliver(uut, MockRequest(dhcp::DHCP_DISCOVER, MAC_A)
            .op(dhcp::OP_REPLY), reply));
        CHECK(reply.type() == 0);
        CHECK(leases.count() == 0);
    }

    SECTION("missing-type") {
        // Messages without a valid type are ignored.
        const u8 OPTS[] = {53, 2, 1, 1, 255};
        std::string raw = MockRequest(dhcp::DHCP_DISCOVER, MAC_A)
            .bytes().substr(0, dhcp::MIN_BYTES) + LEASECAT_MAKE_STRING(OPTS);
        leasecat::io::ArrayRead rd(raw.data(), (unsigned)raw.size());
        Message msg;
        REQUIRE(msg.read_from(&rd));
        CHECK_FALSE(uut.handle(msg, reply));
        CHECK(log.contains("Missing message type"));
    }

    SECTION("no-dns") {
        // DNS option is omitted if there are no DNS servers.
        Params tmp = params;
        tmp.dns_count = 0;
        Server uut2(tmp, &leases);
        REQUIRE(deliver(uut2, MockRequest(dhcp::DHCP_DISCOVER, MAC_A), reply));
        CHECK(reply.options().count() == 4);
        CHECK_FALSE(reply.options().find(dhcp::OPTION_DNS_SERVER));
    }

    SECTION("server-id-advisory") {
        // By default, messages for another server are still processed.
        Message msg;
        REQUIRE(MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .requested_ip(POOL_START).server_id(IP_OTHER).decode(msg));
        CHECK_FALSE(uut.for_this_server(msg));
        CHECK(uut.handle(msg, reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        // Server ID is optional.
        REQUIRE(MockRequest(dhcp::DHCP_REQUEST, MAC_A).decode(msg));
        CHECK(uut.for_this_server(msg));
        REQUIRE(MockRequest(dhcp::DHCP_REQUEST, MAC_A).server_id(IP_SERVER).decode(msg));
        CHECK(uut.for_this_server(msg));
    }

    SECTION("server-id-strict") {
        // In strict mode, messages for another server are ignored.
        Params tmp = params;
        tmp.strict_server_id = true;
        Server strict(tmp, &leases);
        CHECK_FALSE(deliver(strict, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .requested_ip(POOL_START).server_id(IP_OTHER), reply));
        CHECK(leases.count() == 0);
        REQUIRE(deliver(strict, MockRequest(dhcp::DHCP_REQUEST, MAC_A)
            .requested_ip(POOL_START).server_id(IP_SERVER), reply));
        CHECK(reply.type() == dhcp::DHCP_ACK);
        CHECK(leases.count() == 1);
        // Release for another server is also ignored.
        CHECK_FALSE(deliver(strict, MockRequest(dhcp::DHCP_RELEASE, MAC_A)
            .server_id(IP_OTHER), reply));
        CHECK(leases.count() == 1);
        CHECK_FALSE(deliver(strict, MockRequest(dhcp::DHCP_DECLINE, MAC_A)
            .server_id(IP_OTHER), reply));
        CHECK(leases.count() == 1);
        CHECK_FALSE(deliver(strict, MockRequest(dhcp::DHCP_RELEASE, MAC_A), reply));
        CHECK(leases.count() == 0);
        // Discover is never filtered.
        CHECK(deliver(strict, MockRequest(dhcp::DHCP_DISCOVER, MAC_B)
            .server_id(IP_OTHER), reply));
        CHECK(reply.type() == dhcp::DHCP_OFFER);
    }
}
