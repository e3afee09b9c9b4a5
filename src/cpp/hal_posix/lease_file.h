//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Heap-allocated DHCP lease table, persisted to a text file.
//!
//! \details
//! The persistence file holds one lease per line, in the format
//! "<ipv4> <hardware-address> <expiry-msec>", for example:
//!     10.0.0.15 AA:BB:CC:DD:EE:01 1735689600000
//! Lines starting with "#" are comments.  The file is rewritten in full
//! after every change: the new table is written to "<filename>.tmp",
//! which is then renamed over the original.
//!
//! The static-assignment file holds one permanent reservation per line,
//! in the format "<hardware-address>,<ipv4>".

#pragma once

#include <leasecat/dhcp_lease.h>
#include <map>
#include <string>

namespace leasecat {
    namespace dhcp {
        //! Lease table using std::map, with a text-file backing store.
        class LeaseFile final : public leasecat::dhcp::LeaseStore {
        public:
            //! Create an empty table for the pool [start, end).
            //! If the filename is empty, persist() does nothing.
            LeaseFile(
                const leasecat::datetime::Clock* clock,
                const leasecat::ip::Addr& start,
                const leasecat::ip::Addr& end,
                const char* filename);
            ~LeaseFile() {}

            //! Replace the table with the contents of the persistence file.
            //! A missing file yields an empty table.  A malformed file is
            //! discarded entirely, also yielding an empty table.
            //! \returns False if the file was present but malformed.
            bool load();

            //! Overlay permanent reservations from a static-assignment file.
            //! Each reservation overwrites any existing lease for the same
            //! address.  Malformed lines are logged and skipped.
            //! \returns The number of reservations loaded.
            unsigned load_static(const char* filename);

            //! Discard all leases, without persisting.
            void clear();

            //! Read-only access to the underlying table.
            typedef std::map<leasecat::ip::Addr, leasecat::dhcp::Lease> Table;
            inline const Table& table() const
                { return m_table; }

            //! Name of the persistence file.
            inline const char* filename() const
                { return m_filename.c_str(); }

            // Implement the public LeaseStore API.
            const leasecat::dhcp::Lease* lookup(
                const leasecat::ip::Addr& addr) const override;
            bool lookup_mac(
                const leasecat::eth::MacAddr& mac,
                leasecat::ip::Addr& out) const override;
            unsigned count() const override;
            bool persist() override;

        protected:
            // Implement the private LeaseStore API.
            void update(
                const leasecat::ip::Addr& addr,
                const leasecat::dhcp::Lease& lease) override;
            void erase(const leasecat::ip::Addr& addr) override;

            const std::string m_filename;
            Table m_table;
        };
    }
}
