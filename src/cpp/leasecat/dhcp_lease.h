//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! DHCP lease table and address-pool allocator
//!
//!\details
//! The lease table maps each allocated IPv4 address to the hardware address
//! that holds it and the time at which that lease expires.  Expiry is
//! checked lazily, whenever an address is tested for availability.
//!
//! `dhcp::LeaseStore` is an abstract base class.  It implements the
//! availability predicate and the round-robin allocator, but leaves the
//! storage and persistence of the table itself to a child class.  On POSIX
//! platforms that is `dhcp::LeaseFile` (hal_posix/lease_file.h).

#pragma once

#include <leasecat/datetime.h>
#include <leasecat/eth_header.h>
#include <leasecat/ip_core.h>

// Maximum number of outstanding offers remembered by each LeaseStore.
#ifndef LEASECAT_DHCP_MAX_OFFERS
#define LEASECAT_DHCP_MAX_OFFERS 16
#endif

namespace leasecat {
    namespace dhcp {
        //! Permanent reservations expire ten years from the time of loading.
        constexpr s64 LEASE_STATIC = 10 * leasecat::datetime::ONE_YEAR;

        //! Binding of one IPv4 address to one hardware address.
        //! (The address itself is the key in the parent LeaseStore.)
        struct Lease {
            leasecat::eth::MacAddr mac;     //!< Current holder
            s64 expiry;                     //!< Milliseconds since epoch

            inline bool operator==(const leasecat::dhcp::Lease& other) const
                { return mac == other.mac && expiry == other.expiry; }
            inline bool operator!=(const leasecat::dhcp::Lease& other) const
                { return !operator==(other); }
        };

        //! An address offered to a client that has not yet requested it.
        struct Offer {
            leasecat::eth::MacAddr mac;
            leasecat::ip::Addr addr;        //!< ADDR_NONE if unused
        };

        //! Abstract lease table for a contiguous pool of addresses.
        //!
        //! The pool covers the half-open range [start, end).  Leases may also
        //! be stored for addresses outside that range (e.g., permanent
        //! reservations), but such addresses are never offered.
        //!
        //! The allocator keeps a cursor (`last_lease`) holding the
        //! pool-relative index of the most recent offer.  Each search begins
        //! just after the cursor, spreading reuse across the entire pool.
        //!
        //! Outstanding offers are kept in a small table that is not
        //! persisted.  Inserting or removing a lease clears any offer for
        //! the same address or client; otherwise the oldest entry is
        //! overwritten when the table is full.
        class LeaseStore {
        public:
            //! Is this address available to the designated client?
            //! True if it is inside the pool, and it is unleased, already
            //! leased to the same client, or leased with an expired lease.
            bool available(
                const leasecat::eth::MacAddr& mac,
                const leasecat::ip::Addr& addr) const;

            //! Find the address currently held by the designated client.
            //! \returns True if found.  Expired leases are included.
            inline bool current_lease(
                const leasecat::eth::MacAddr& mac,
                leasecat::ip::Addr& out) const
                { return lookup_mac(mac, out); }

            //! Overwrite any existing lease with a new one, then persist.
            void insert(
                const leasecat::ip::Addr& addr,
                const leasecat::eth::MacAddr& mac,
                s64 expiry);

            //! Remove the designated lease if present, then persist.
            void remove(const leasecat::ip::Addr& addr);

            //! Find the next available address for the designated client.
            //! Scans each address in the pool at most once, starting just
            //! after the previous result.
            //! \returns The first available address, or ADDR_NONE if the
            //! pool is exhausted.
            leasecat::ip::Addr allocate(const leasecat::eth::MacAddr& mac);

            //! Note that an address was offered to the designated client.
            void remember_offer(
                const leasecat::eth::MacAddr& mac,
                const leasecat::ip::Addr& addr);

            //! Find the outstanding offer for the designated client.
            //! \returns True if found and the address is still available.
            bool pending_offer(
                const leasecat::eth::MacAddr& mac,
                leasecat::ip::Addr& out) const;

            //! Is the designated address inside the pool?
            bool contains(const leasecat::ip::Addr& addr) const;

            //! Set the allocator cursor to the highest pool index that is
            //! currently leased.  Call this after loading a new table.
            void reset_cursor();

            //! Accessors for the pool configuration and allocator state.
            //!@{
            inline leasecat::ip::Addr pool_start() const
                { return m_start; }
            inline leasecat::ip::Addr pool_end() const
                { return m_end; }
            inline unsigned pool_size() const
                { return (unsigned)(m_end.value - m_start.value); }
            inline unsigned last_lease() const
                { return m_last; }
            inline s64 now() const
                { return m_clock->now(); }
            //!@}

            //! Fetch the lease for the designated address, or NULL.
            //! Child classes MUST override this method.
            virtual const leasecat::dhcp::Lease* lookup(
                const leasecat::ip::Addr& addr) const = 0;

            //! Find the lowest address held by the designated client.
            //! Child classes MUST override this method.
            virtual bool lookup_mac(
                const leasecat::eth::MacAddr& mac,
                leasecat::ip::Addr& out) const = 0;

            //! Total number of stored leases, including expired leases.
            //! Child classes MUST override this method.
            virtual unsigned count() const = 0;

            //! Write the entire table to nonvolatile storage.
            //! Failures must be logged; the in-memory table is unchanged.
            //! Child classes MUST override this method.
            virtual bool persist() = 0;

        protected:
            //! Only children should create or destroy the base class.
            //! The clock object must outlive this object.
            LeaseStore(
                const leasecat::datetime::Clock* clock,
                const leasecat::ip::Addr& start,
                const leasecat::ip::Addr& end);
            ~LeaseStore() {}

            //! Store or remove a single lease, without persisting.
            //! Child classes MUST override these methods.
            //!@{
            virtual void update(
                const leasecat::ip::Addr& addr,
                const leasecat::dhcp::Lease& lease) = 0;
            virtual void erase(const leasecat::ip::Addr& addr) = 0;
            //!@}

            // Clear offers matching either the client or the address.
            void forget_offer(
                const leasecat::eth::MacAddr& mac,
                const leasecat::ip::Addr& addr);

            const leasecat::datetime::Clock* const m_clock;
            const leasecat::ip::Addr m_start;
            const leasecat::ip::Addr m_end;
            unsigned m_last;
            unsigned m_next_offer;
            leasecat::dhcp::Offer m_offers[LEASECAT_DHCP_MAX_OFFERS];
        };
    }
}
