//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Connect a DHCP server to a Linux UDP socket.

#pragma once

#include <leasecat/dhcp_message.h>

// Size of the receive and transmit buffers, in bytes.
#ifndef LEASECAT_DHCP_BUFFSIZE
#define LEASECAT_DHCP_BUFFSIZE 1500
#endif

namespace leasecat {
    namespace dhcp {
        //! Connect a `dhcp::Server` to a Linux UDP socket.
        //! This is a thin wrapper around the "sys/socket.h" API.  It runs
        //! in a single thread: each datagram is received, decoded, handled,
        //! and answered before the next is received.
        class SocketPosix {
        public:
            //! Attach this socket to a server object.
            //! \param server The DHCP server state machine.
            //! \param broadcast Destination address for broadcast replies.
            //! \param server_port Local port (normally 67).
            //! \param client_port Remote port for replies (normally 68).
            SocketPosix(
                leasecat::dhcp::Server* server,
                const leasecat::ip::Addr& broadcast,
                const leasecat::ip::Port& server_port = leasecat::ip::PORT_DHCP_SERVER,
                const leasecat::ip::Port& client_port = leasecat::ip::PORT_DHCP_CLIENT);
            ~SocketPosix();

            //! Open the socket and bind to the server port on all local
            //! addresses, optionally restricted to a named interface.
            //! \returns False if the socket could not be opened.
            bool bind(const char* intf = 0);

            //! Close the socket and return to idle.
            void close();

            //! Is the socket currently open?
            inline bool is_open() const
                { return m_sock >= 0; }

            //! Wait for and process a single datagram.
            //! \param timeout_msec Maximum wait, or zero to wait forever.
            //! \returns True if a datagram was received.
            bool service_once(unsigned timeout_msec = 0);

            //! Process datagrams until the socket is closed.
            void run();

            //! Select the destination for a given reply.
            //! Broadcast if requested or if the client has no address yet,
            //! otherwise the relay agent if present, otherwise the client.
            void destination(
                const leasecat::dhcp::Message& req,
                const leasecat::dhcp::Reply& reply,
                leasecat::ip::Addr& dst_addr,
                leasecat::ip::Port& dst_port) const;

            //! Traffic statistics since creation.
            //!@{
            inline unsigned count_rcvd() const {return m_count_rcvd;}
            inline unsigned count_sent() const {return m_count_sent;}
            inline unsigned count_drop() const {return m_count_drop;}
            //!@}

        private:
            // Handle one received datagram.
            void process(unsigned nbytes);

            leasecat::dhcp::Server* const m_server;
            const leasecat::ip::Addr m_broadcast;
            const leasecat::ip::Port m_server_port;
            const leasecat::ip::Port m_client_port;
            int m_sock;
            unsigned m_count_rcvd;
            unsigned m_count_sent;
            unsigned m_count_drop;
            u8 m_rxbuff[LEASECAT_DHCP_BUFFSIZE];
            u8 m_txbuff[LEASECAT_DHCP_BUFFSIZE];
        };
    }
}
