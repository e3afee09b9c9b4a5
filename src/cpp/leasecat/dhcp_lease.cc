//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <leasecat/dhcp_lease.h>
#include <leasecat/log.h>

// Enable additional diagnostics? (0/1/2)
static constexpr unsigned DEBUG_VERBOSE = 0;

namespace log = leasecat::log;
using leasecat::dhcp::Lease;
using leasecat::dhcp::LeaseStore;
using leasecat::dhcp::Offer;
using leasecat::eth::MacAddr;
using leasecat::ip::Addr;
using leasecat::ip::ADDR_NONE;

LeaseStore::LeaseStore(
        const leasecat::datetime::Clock* clock,
        const Addr& start, const Addr& end)
    : m_clock(clock)
    , m_start(start)
    , m_end(end)
    , m_last(0)
    , m_next_offer(0)
    , m_offers()
{
    // With an empty table, the first search starts at the pool base.
    if (pool_size()) m_last = pool_size() - 1;
    for (unsigned a = 0 ; a < LEASECAT_DHCP_MAX_OFFERS ; ++a)
        m_offers[a].addr = ADDR_NONE;
}

bool LeaseStore::contains(const Addr& addr) const {
    return (m_start.value <= addr.value) && (addr.value < m_end.value);
}

bool LeaseStore::available(const MacAddr& mac, const Addr& addr) const {
    if (!contains(addr)) return false;
    const Lease* lease = lookup(addr);
    if (!lease) return true;                    // Never leased
    if (lease->mac == mac) return true;         // Renewal by holder
    return m_clock->now() > lease->expiry;      // Expired lease
}

void LeaseStore::insert(const Addr& addr, const MacAddr& mac, s64 expiry) {
    Lease lease = {mac, expiry};
    forget_offer(mac, addr);
    update(addr, lease);
    log::Log(log::INFO, "Lease store: Insert").write(addr).write(mac);
    persist();
}

void LeaseStore::remove(const Addr& addr) {
    const Lease* lease = lookup(addr);
    if (lease) {
        forget_offer(lease->mac, addr);
        erase(addr);
        log::Log(log::INFO, "Lease store: Remove").write(addr);
    }
    persist();
}

Addr LeaseStore::allocate(const MacAddr& mac) {
    unsigned size = pool_size();
    for (unsigned a = 0 ; a < size ; ++a) {
        m_last = (m_last + 1) % size;
        Addr candidate = m_start + m_last;
        if (available(mac, candidate)) {
            if (DEBUG_VERBOSE > 0)
                log::Log(log::DEBUG, "Lease store: Candidate").write(candidate);
            return candidate;
        }
    }
    return ADDR_NONE;
}

void LeaseStore::remember_offer(const MacAddr& mac, const Addr& addr) {
    // Replace this client's previous offer, if any.
    forget_offer(mac, ADDR_NONE);
    Offer& slot = m_offers[m_next_offer];
    slot.mac  = mac;
    slot.addr = addr;
    m_next_offer = (m_next_offer + 1) % LEASECAT_DHCP_MAX_OFFERS;
}

bool LeaseStore::pending_offer(const MacAddr& mac, Addr& out) const {
    for (unsigned a = 0 ; a < LEASECAT_DHCP_MAX_OFFERS ; ++a) {
        const Offer& slot = m_offers[a];
        if (!slot.addr.is_valid() || slot.mac != mac) continue;
        if (!available(mac, slot.addr)) return false;
        out = slot.addr;
        return true;
    }
    return false;
}

void LeaseStore::forget_offer(const MacAddr& mac, const Addr& addr) {
    for (unsigned a = 0 ; a < LEASECAT_DHCP_MAX_OFFERS ; ++a) {
        Offer& slot = m_offers[a];
        if (!slot.addr.is_valid()) continue;
        if (slot.mac == mac || (addr.is_valid() && slot.addr == addr))
            slot.addr = ADDR_NONE;
    }
}

void LeaseStore::reset_cursor() {
    // Search downward for the highest leased index.
    unsigned size = pool_size();
    for (unsigned a = size ; a > 0 ; --a) {
        if (lookup(m_start + (a-1))) {
            m_last = a - 1;
            return;
        }
    }
    // Empty pool, restart from the base.
    m_last = size ? (size - 1) : 0;
}
