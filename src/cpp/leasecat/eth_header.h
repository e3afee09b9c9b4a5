//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Type definitions for Ethernet hardware addresses
//
// DHCP identifies each client by its hardware address (CHADDR).  For
// Ethernet (HTYPE = 1), that is the 6-byte MAC address defined here.
//
// Note: Due to byte-alignment and byte-ordering issues, direct use of
//       write_bytes and read_bytes on these structures is not
//       recommended.  Please use the provided write and read methods.
//

#pragma once

#include <leasecat/io_readable.h>
#include <leasecat/io_writeable.h>

namespace leasecat {
    namespace eth {
        // An Ethernet MAC address (with serializable interface).
        struct MacAddr {
            // Byte array in network order (Index 0 = MSB)
            u8 addr[6];

            // Basic comparisons.
            bool operator==(const leasecat::eth::MacAddr& other) const;
            bool operator<(const leasecat::eth::MacAddr& other) const;
            inline bool operator!=(const leasecat::eth::MacAddr& other) const
                {return !operator==(other);}

            // Is this a valid MAC of any kind? (i.e., Not zero)
            bool is_valid() const;

            // I/O functions.
            inline void write_to(leasecat::io::Writeable* wr) const
                {wr->write_bytes(6, addr);}
            inline bool read_from(leasecat::io::Readable* rd)
                {return rd->read_bytes(6, addr);}

            // Log formatting (e.g., "DE:AD:BE:EF:CA:FE").
            void log_to(leasecat::log::LogBuffer& wr) const;
        };

        // Parse six hexadecimal bytes separated by ":" or "-".
        // (e.g., "DE:AD:BE:EF:CA:FE" or "de-ad-be-ef-ca-fe")
        // Returns false if the entire string is not a valid address.
        bool parse_mac(const char* str, leasecat::eth::MacAddr& out);

        // Commonly used MAC addresses.
        constexpr leasecat::eth::MacAddr MACADDR_NONE
            = {{0x00, 0x00, 0x00, 0x00, 0x00, 0x00}};
    }
}
