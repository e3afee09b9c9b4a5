//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Configuration file for the DHCP server daemon.
//!
//! \details
//! The configuration is a flat list of "key = value" pairs, one per line.
//! Text following "#" or ";" is a comment.  Whitespace around each key and
//! value is ignored.  Example:
//!     listen_addr = 10.0.0.1
//!     start       = 10.0.0.10
//!     end         = 10.0.0.20     # Exclusive
//!     netmask     = 255.255.255.0
//!     broadcast   = 10.0.0.255
//!     gateway     = 10.0.0.1
//!     dns_servers = 10.0.0.1, 8.8.8.8
//!     lease_file  = /var/lib/leasecat/leases.txt
//!     lease_time  = 24h

#pragma once

#include <leasecat/dhcp_server.h>
#include <leasecat/io_readable.h>
#include <string>
#include <vector>

namespace leasecat {
    namespace dhcp {
        //! Parse a duration string, such as "24h", "1h30m", "90s", "1d",
        //! or a bare number of seconds.  Units are d, h, m, and s.
        //! \returns False if the string is empty, malformed, or too long
        //! to represent in 32 bits.
        bool parse_duration(const char* str, u32& secs);

        //! Parse a boolean ("true", "false", "yes", "no", "1", "0").
        bool parse_bool(const char* str, bool& out);

        //! Parsed contents of a configuration file.
        class Config {
        public:
            //! Create a blank configuration.
            Config();

            //! Read and validate the designated configuration file.
            //! \returns False if the file is missing or invalid.
            bool load(const char* filename);

            //! Read and validate configuration text from any source.
            //! All errors are logged with the offending line or key.
            //! \returns False if the configuration is invalid.
            bool read_from(leasecat::io::Readable* src);

            //! Server parameters derived from this configuration.
            leasecat::dhcp::Params params() const;

            // Parsed configuration values.
            std::string intf;                   //!< Interface name (optional)
            leasecat::ip::Addr listen_addr;     //!< Server identifier
            leasecat::ip::Addr start;           //!< First pool address
            leasecat::ip::Addr end;             //!< Last pool address + 1
            leasecat::ip::Mask netmask;         //!< Subnet mask
            leasecat::ip::Addr broadcast;       //!< Broadcast reply address
            leasecat::ip::Addr gateway;         //!< Default router
            std::vector<leasecat::ip::Addr> dns_servers;
            std::string lease_static;           //!< Static assignments (optional)
            std::string lease_file;             //!< Persistence file
            u32 lease_secs;                     //!< Lease duration
            bool strict_server_id;              //!< Ignore other servers' traffic
            s8 log_level;                       //!< Console log threshold

        private:
            // Parse a single key/value pair.
            bool parse_pair(const std::string& key, const std::string& value);
            // Confirm all required keys were provided.
            bool validate() const;

            std::vector<std::string> m_keys;    // Keys seen so far
        };
    }
}
