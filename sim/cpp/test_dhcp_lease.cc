//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for the DHCP lease table and address allocator

#include <catch2/catch.hpp>
#include <hal_posix/lease_file.h>
#include <hal_test/sim_utils.h>
#include <leasecat/dhcp_lease.h>

using leasecat::datetime::ONE_HOUR;
using leasecat::dhcp::Lease;
using leasecat::dhcp::LeaseFile;
using leasecat::eth::MacAddr;
using leasecat::ip::Addr;
using leasecat::ip::ADDR_NONE;
using leasecat::test::client_mac;
using leasecat::test::MockClock;

TEST_CASE("dhcp-lease") {
    // Simulation infrastructure.
    LEASECAT_TEST_START;
    log.disable();
    MockClock clock;

    // Unit under test has a pool of ten addresses and no backing file.
    const Addr POOL_START(10, 0, 0, 10);
    const Addr POOL_END(10, 0, 0, 20);
    const MacAddr MAC_A = client_mac(1);
    const MacAddr MAC_B = client_mac(2);
    LeaseFile uut(&clock, POOL_START, POOL_END, "");
    const s64 EXPIRY = clock.now() + ONE_HOUR;

    SECTION("geometry") {
        CHECK(uut.pool_start() == POOL_START);
        CHECK(uut.pool_end() == POOL_END);
        CHECK(uut.pool_size() == 10);
        CHECK(uut.contains(POOL_START));
        CHECK(uut.contains(Addr(10, 0, 0, 19)));
        CHECK_FALSE(uut.contains(POOL_END));
        CHECK_FALSE(uut.contains(Addr(10, 0, 0, 9)));
        CHECK(uut.count() == 0);
    }

    SECTION("available") {
        const Addr IP(10, 0, 0, 12);
        CHECK(uut.available(MAC_A, IP));            // Never leased
        uut.insert(IP, MAC_A, EXPIRY);
        CHECK(uut.available(MAC_A, IP));            // Renewal by holder
        CHECK_FALSE(uut.available(MAC_B, IP));      // Held by another
        clock.set(EXPIRY);
        CHECK_FALSE(uut.available(MAC_B, IP));      // Expires at end of tick
        clock.advance(1);
        CHECK(uut.available(MAC_B, IP));            // Expired
        CHECK_FALSE(uut.available(MAC_A, POOL_END));
        CHECK_FALSE(uut.available(MAC_A, Addr(192, 168, 1, 1)));
    }

    SECTION("lookup") {
        const Addr IP(10, 0, 0, 15);
        uut.insert(IP, MAC_A, EXPIRY);
        const Lease* lease = uut.lookup(IP);
        REQUIRE(lease);
        CHECK(lease->mac == MAC_A);
        CHECK(lease->expiry == EXPIRY);
        CHECK_FALSE(uut.lookup(IP + 1));
        CHECK(uut.count() == 1);
        // Overwrite the existing lease.
        uut.insert(IP, MAC_B, EXPIRY + 1);
        CHECK(uut.count() == 1);
        CHECK(uut.lookup(IP)->mac == MAC_B);
        // Remove it, then remove it again.
        uut.remove(IP);
        CHECK(uut.count() == 0);
        uut.remove(IP);
        CHECK(uut.count() == 0);
    }

    SECTION("current-lease") {
        Addr addr = ADDR_NONE;
        CHECK_FALSE(uut.current_lease(MAC_A, addr));
        CHECK(addr == ADDR_NONE);
        uut.insert(Addr(10, 0, 0, 17), MAC_A, EXPIRY);
        uut.insert(Addr(10, 0, 0, 13), MAC_A, EXPIRY);
        uut.insert(Addr(10, 0, 0, 11), MAC_B, EXPIRY);
        // Lowest address held by the client is reported.
        CHECK(uut.current_lease(MAC_A, addr));
        CHECK(addr == Addr(10, 0, 0, 13));
        // Expired leases are still reported.
        clock.advance(2 * ONE_HOUR);
        CHECK(uut.current_lease(MAC_B, addr));
        CHECK(addr == Addr(10, 0, 0, 11));
    }

    SECTION("first-offer") {
        // Empty table starts at the base of the pool.
        CHECK(uut.allocate(MAC_A) == POOL_START);
        CHECK(uut.last_lease() == 0);
    }

    SECTION("round-robin") {
        // Without an insert, each call moves to the next address.
        CHECK(uut.allocate(MAC_A) == Addr(10, 0, 0, 10));
        CHECK(uut.allocate(MAC_A) == Addr(10, 0, 0, 11));
        CHECK(uut.allocate(MAC_B) == Addr(10, 0, 0, 12));
        // Freed addresses are not reused until the cursor wraps around.
        uut.insert(Addr(10, 0, 0, 13), MAC_B, EXPIRY);
        CHECK(uut.allocate(MAC_A) == Addr(10, 0, 0, 14));
        for (unsigned a = 15 ; a < 20 ; ++a)
            CHECK(uut.allocate(MAC_A) == Addr(10, 0, 0, a));
        CHECK(uut.allocate(MAC_A) == Addr(10, 0, 0, 10));
    }

    SECTION("skip-leased") {
        uut.insert(Addr(10, 0, 0, 10), MAC_B, EXPIRY);
        uut.insert(Addr(10, 0, 0, 11), MAC_B, EXPIRY);
        CHECK(uut.allocate(MAC_A) == Addr(10, 0, 0, 12));
        CHECK(uut.last_lease() == 2);
    }

    SECTION("exhaustion") {
        // Lease every address in the pool to some other client.
        for (unsigned a = 0 ; a < uut.pool_size() ; ++a) {
            Addr addr = uut.allocate(client_mac(u8(100 + a)));
            REQUIRE(uut.contains(addr));
            uut.insert(addr, client_mac(u8(100 + a)), EXPIRY);
        }
        CHECK(uut.count() == 10);
        CHECK(uut.allocate(MAC_A) == ADDR_NONE);
        CHECK(uut.allocate(MAC_B) == ADDR_NONE);
        // Once leases expire, allocation resumes.
        clock.set(EXPIRY + 1);
        Addr addr = uut.allocate(MAC_A);
        CHECK(uut.contains(addr));
    }

    SECTION("bounds") {
        // Every allocated address must be inside the pool.
        for (unsigned a = 0 ; a < 50 ; ++a) {
            Addr addr = uut.allocate(client_mac(u8(a)));
            CHECK(POOL_START.value <= addr.value);
            CHECK(addr.value < POOL_END.value);
        }
    }

    SECTION("reset-cursor") {
        uut.insert(Addr(10, 0, 0, 12), MAC_A, EXPIRY);
        uut.insert(Addr(10, 0, 0, 15), MAC_B, EXPIRY);
        uut.insert(Addr(10, 0, 0, 30), MAC_B, EXPIRY);  // Outside pool
        uut.reset_cursor();
        CHECK(uut.last_lease() == 5);
        CHECK(uut.allocate(client_mac(3)) == Addr(10, 0, 0, 16));
        // Empty table resets to the base of the pool.
        uut.clear();
        CHECK(uut.count() == 0);
        CHECK(uut.allocate(MAC_A) == POOL_START);
    }

    SECTION("offers") {
        Addr addr;
        CHECK_FALSE(uut.pending_offer(MAC_A, addr));
        uut.remember_offer(MAC_A, Addr(10, 0, 0, 13));
        uut.remember_offer(MAC_B, Addr(10, 0, 0, 14));
        CHECK(uut.pending_offer(MAC_A, addr));
        CHECK(addr == Addr(10, 0, 0, 13));
        // A newer offer replaces the older one.
        uut.remember_offer(MAC_A, Addr(10, 0, 0, 16));
        CHECK(uut.pending_offer(MAC_A, addr));
        CHECK(addr == Addr(10, 0, 0, 16));
        // Offer is dropped once another client takes the address.
        uut.insert(Addr(10, 0, 0, 16), client_mac(3), EXPIRY);
        CHECK_FALSE(uut.pending_offer(MAC_A, addr));
        // Or once the same client takes a lease.
        uut.insert(Addr(10, 0, 0, 14), MAC_B, EXPIRY);
        CHECK_FALSE(uut.pending_offer(MAC_B, addr));
        // When full, the oldest entry is overwritten.
        for (unsigned a = 0 ; a <= LEASECAT_DHCP_MAX_OFFERS ; ++a)
            uut.remember_offer(client_mac(u8(100 + a)), POOL_START + (a % 4));
        CHECK(uut.pending_offer(client_mac(u8(100 + LEASECAT_DHCP_MAX_OFFERS)), addr));
        CHECK(addr == POOL_START + (LEASECAT_DHCP_MAX_OFFERS % 4));
        CHECK(uut.pending_offer(client_mac(101), addr));
        CHECK_FALSE(uut.pending_offer(client_mac(100), addr));
    }

    SECTION("outside-pool") {
        // Out-of-pool leases are stored, but never available.
        const Addr IP_OUT(10, 0, 0, 30);
        uut.insert(IP_OUT, MAC_A, EXPIRY);
        Addr addr;
        CHECK(uut.current_lease(MAC_A, addr));
        CHECK(addr == IP_OUT);
        CHECK_FALSE(uut.available(MAC_A, IP_OUT));
    }
}

TEST_CASE("dhcp-lease-tiny") {
    // Simulation infrastructure.
    LEASECAT_TEST_START;
    log.disable();
    MockClock clock;

    SECTION("single") {
        LeaseFile uut(&clock, Addr(10, 0, 0, 10), Addr(10, 0, 0, 11), "");
        CHECK(uut.pool_size() == 1);
        CHECK(uut.allocate(client_mac(1)) == Addr(10, 0, 0, 10));
        CHECK(uut.allocate(client_mac(1)) == Addr(10, 0, 0, 10));
        uut.insert(Addr(10, 0, 0, 10), client_mac(1), clock.now() + ONE_HOUR);
        CHECK(uut.allocate(client_mac(1)) == Addr(10, 0, 0, 10));
        CHECK(uut.allocate(client_mac(2)) == ADDR_NONE);
    }

    SECTION("empty") {
        LeaseFile uut(&clock, Addr(10, 0, 0, 10), Addr(10, 0, 0, 10), "");
        CHECK(uut.pool_size() == 0);
        CHECK(uut.allocate(client_mac(1)) == ADDR_NONE);
    }
}
