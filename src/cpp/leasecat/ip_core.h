//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Basic type definitions for Internet Protocol v4 addresses

#pragma once

#include <leasecat/io_readable.h>
#include <leasecat/io_writeable.h>

namespace leasecat {
    namespace ip {
        // IPv4 address is a 32-bit unsigned integer.
        struct Addr {
            // Raw access to the underlying representation.
            u32 value;

            // Constructors.
            constexpr Addr()
                : value(0) {}
            constexpr Addr(u32 ip)  // NOLINT
                : value(ip) {}
            constexpr Addr(u8 a, u8 b, u8 c, u8 d)
                : value(16777216ul * a + 65536ul * b + 256ul * c + d) {}

            // Commonly used operators.
            constexpr bool operator==(const leasecat::ip::Addr& other) const
                {return value == other.value;}
            constexpr bool operator!=(const leasecat::ip::Addr& other) const
                {return value != other.value;}
            constexpr bool operator<(const leasecat::ip::Addr& other) const
                {return value < other.value;}
            inline void write_to(leasecat::io::Writeable* wr) const
                {wr->write_u32(value);}
            inline bool read_from(leasecat::io::Readable* rd)
                {value = rd->read_u32(); return true;}
            constexpr leasecat::ip::Addr operator+(unsigned offset) const
                {return leasecat::ip::Addr(value + (u32)offset);}

            // Log formatting.
            void log_to(leasecat::log::LogBuffer& wr) const;

            // Any nonzero address?
            bool is_valid() const;
        };

        // Parse dotted-quad notation (e.g., "192.168.1.42").
        // Returns false if the entire string is not a valid address.
        bool parse_addr(const char* str, leasecat::ip::Addr& out);

        // IPv4 subnet masks share functionality with a basic address,
        // but are constructed differently to match common conventions.
        struct Mask : public leasecat::ip::Addr {
            constexpr Mask()
                : Addr() {}
            constexpr Mask(u8 a, u8 b, u8 c, u8 d)
                : Addr(a, b, c, d) {}
            constexpr Mask(const leasecat::ip::Addr& addr)  // NOLINT
                : Addr(addr.value) {}

            // Is this a contiguous CIDR mask? (e.g., 255.255.255.0)
            bool is_cidr() const;
        };

        // UDP and TCP ports are both 16-bit unsigned integers.
        struct Port {
            // Raw access to the underlying representation.
            u16 value;

            // Constructor.
            constexpr Port(u16 port) : value(port) {}   // NOLINT

            // Commonly used operators.
            constexpr bool operator==(const leasecat::ip::Port& other) const
                {return value == other.value;}
            constexpr bool operator!=(const leasecat::ip::Port& other) const
                {return value != other.value;}
        };

        // Commonly used IP-addresses and other constants:
        constexpr leasecat::ip::Addr ADDR_NONE  = 0;
        constexpr leasecat::ip::Addr ADDR_LOOPBACK
            = leasecat::ip::Addr(127, 0, 0, 1);

        // Well-known UDP ports for DHCP (RFC 2131 Section 4.1).
        constexpr leasecat::ip::Port PORT_DHCP_SERVER = 67;
        constexpr leasecat::ip::Port PORT_DHCP_CLIENT = 68;
    }
}
