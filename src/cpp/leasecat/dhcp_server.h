//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! DHCP server protocol state machine
//!
//!\details
//! The server is stateless on a per-packet basis: all persistent state
//! lives in the `dhcp::LeaseStore`.  Each call to `Server::handle()`
//! interprets one decoded client message, updates the lease table if
//! required, and formulates the reply (if any):
//!  * Discover: Offer the client's existing address, its previous offer if
//!    still available, or the next available address from the pool.
//!    Silently ignored if the pool is exhausted.
//!  * Request: Ack and renew the client's existing address.  Otherwise
//!    grant the requested address (option 50, or CIADDR) if available,
//!    or send a Nak if it is not.
//!  * Release / Decline: Drop the client's existing lease, if any.
//!  * Anything else: Ignored.
//!
//! Transmission of the reply is the caller's responsibility.
//! See also: `dhcp::SocketPosix` (hal_posix/dhcp_socket.h).

#pragma once

#include <leasecat/dhcp_message.h>

// Maximum number of DNS servers advertised in each Offer / Ack.
#ifndef LEASECAT_DHCP_MAX_DNS
#define LEASECAT_DHCP_MAX_DNS 8
#endif

namespace leasecat {
    namespace dhcp {
        //! Reason string sent with each Nak.
        constexpr const char* NAK_UNAVAILABLE = "Requested IP not available";

        //! Fixed parameters advertised to each client.
        struct Params {
            leasecat::ip::Addr server;      //!< Server identifier (option 54)
            leasecat::ip::Mask netmask;     //!< Subnet mask (option 1)
            leasecat::ip::Addr gateway;     //!< Router (option 3)
            unsigned dns_count;             //!< Number of DNS servers
            leasecat::ip::Addr dns[LEASECAT_DHCP_MAX_DNS];
            u32 lease_secs;                 //!< Lease duration (option 51)
            bool strict_server_id;          //!< Ignore messages for others?

            Params();
        };

        //! DHCP server for a single address pool.
        class Server {
        public:
            //! Bind this server to its parameters and lease table.
            //! The lease table must outlive this object.
            Server(
                const leasecat::dhcp::Params& params,
                leasecat::dhcp::LeaseStore* store);

            //! Process one incoming message.
            //! \returns True if the caller should send the reply.
            bool handle(
                const leasecat::dhcp::Message& msg,
                leasecat::dhcp::Reply& reply);

            //! Is this message addressed to this server?  True if the
            //! server-identifier option is absent or matches our address.
            bool for_this_server(const leasecat::dhcp::Message& msg) const;

            inline const leasecat::dhcp::Params& params() const
                { return m_params; }

        private:
            // Handlers for each message type.
            bool discover(const leasecat::dhcp::Message& msg, leasecat::dhcp::Reply& reply);
            bool request(const leasecat::dhcp::Message& msg, leasecat::dhcp::Reply& reply);
            void release(const leasecat::dhcp::Message& msg);

            // Formulate each type of reply.
            void grant(leasecat::dhcp::Reply& reply, u8 type,
                const leasecat::ip::Addr& addr, const leasecat::ip::Addr& client);
            void refuse(leasecat::dhcp::Reply& reply, const char* why);

            const leasecat::dhcp::Params m_params;
            leasecat::dhcp::LeaseStore* const m_store;
        };
    }
}
