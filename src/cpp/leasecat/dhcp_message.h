//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Dynamic Host Configuration Protocol (DHCP) message codec
//!
//!\details
//! Each DHCP message is a legacy BOOTP header (236 bytes), followed by a
//! four-byte "magic cookie" and a series of type/length/value options.
//! This file defines the decoder for incoming client messages
//! (`dhcp::Message`) and the encoder for outgoing server replies
//! (`dhcp::Reply`).  Neither object allocates memory; option contents are
//! copied into a fixed-size buffer inside the parent object.
//!
//! Decoding never reads out of bounds.  A buffer that is too short to
//! hold the fixed header, or that has the wrong magic cookie, is rejected.
//! An option whose length overruns the buffer ends the option walk, but
//! the options read up to that point are retained.  Options with unknown
//! tags are kept as raw bytes, so `Message::option(tag)` works for any tag.
//!
//! See also: IETF RFC2131: https://www.rfc-editor.org/rfc/rfc2131
//! See also: IETF RFC2132: https://www.rfc-editor.org/rfc/rfc2132

#pragma once

#include <leasecat/eth_header.h>
#include <leasecat/ip_core.h>

// Maximum number of options stored per message.
#ifndef LEASECAT_DHCP_MAX_OPTIONS
#define LEASECAT_DHCP_MAX_OPTIONS 96
#endif

// Maximum combined length of all stored option values, in bytes.
// (Default is enough for any DHCP message in a 1500-byte datagram.)
#ifndef LEASECAT_DHCP_OPTION_BYTES
#define LEASECAT_DHCP_OPTION_BYTES 1260
#endif

namespace leasecat {
    namespace dhcp {
        //! Opcodes for the legacy "OP" field from BOOTP.
        //!@{
        constexpr u8 OP_REQUEST         = 1;
        constexpr u8 OP_REPLY           = 2;
        //!@}

        //! DHCP "magic cookie" identifier.
        constexpr u32 DHCP_MAGIC        = 0x63825363;

        //! Request bits in the FLAGS header.
        constexpr u16 FLAG_BROADCAST    = 0x8000;

        //! Field lengths in the BOOTP/DHCP header.
        //!@{
        constexpr unsigned MACADDR_LEN  = 6;
        constexpr unsigned CHADDR_LEN   = 16;
        constexpr unsigned LEGACY_BYTES = 192;  // SNAME + FILE
        constexpr unsigned HEADER_BYTES = 236;  // Fixed BOOTP header
        constexpr unsigned MIN_BYTES    = 240;  // Header + magic cookie
        //!@}

        //! DHCP message types for use with OPTION_MSG_TYPE.
        //!@{
        constexpr u8 DHCP_DISCOVER      = 1;    // Client to server
        constexpr u8 DHCP_OFFER         = 2;    // Server to client
        constexpr u8 DHCP_REQUEST       = 3;    // Client to server
        constexpr u8 DHCP_DECLINE       = 4;    // Client to server
        constexpr u8 DHCP_ACK           = 5;    // Server to client
        constexpr u8 DHCP_NAK           = 6;    // Server to client
        constexpr u8 DHCP_RELEASE       = 7;    // Client to server
        constexpr u8 DHCP_INFORM        = 8;    // Client to server
        //!@}

        //! Human-readable name for a DHCP message type.
        const char* type_label(u8 msg_type);

        //! DHCP option codes used by this server.
        //! Type/length/value except as noted.
        //!@{
        constexpr u8 OPTION_PAD         = 0;    // No length
        constexpr u8 OPTION_SUBNET_MASK = 1;
        constexpr u8 OPTION_ROUTER      = 3;
        constexpr u8 OPTION_DNS_SERVER  = 6;
        constexpr u8 OPTION_REQUEST_IP  = 50;
        constexpr u8 OPTION_LEASE_TIME  = 51;
        constexpr u8 OPTION_MSG_TYPE    = 53;
        constexpr u8 OPTION_SERVER_ID   = 54;
        constexpr u8 OPTION_MESSAGE     = 56;
        constexpr u8 OPTION_END         = 255;  // No length
        //!@}

        //! A single type/length/value option.
        //! The value pointer refers to storage in the parent OptionTable.
        struct Option {
            u8 tag;                 //!< Option code (e.g., OPTION_ROUTER)
            u8 len;                 //!< Length of the value, in bytes
            const u8* data;         //!< Pointer to the value

            //! Typed accessors.  Each returns false if the length does not
            //! match the expected format, leaving the output unchanged.
            //!@{
            bool as_u8(u8& out) const;
            bool as_u32(u32& out) const;
            bool as_addr(leasecat::ip::Addr& out) const;
            //!@}

            //! Number of addresses in a list-type option (e.g., Router),
            //! or zero if the length is not a multiple of four.
            unsigned addr_count() const;

            //! Fetch the Nth address from a list-type option.
            leasecat::ip::Addr addr_at(unsigned idx) const;

            //! Copy a text option (e.g., Message) as a null-terminated string.
            //! \returns The length of the output string, which may be
            //! truncated as needed to fit in the provided buffer.
            unsigned as_text(unsigned dst_size, char* dst) const;

            //! Readable view of the raw option value.
            inline leasecat::io::ArrayRead read() const
                { return leasecat::io::ArrayRead(data, len); }
        };

        //! Ordered container for DHCP options.
        //! Items are kept in the order they are appended.  Lookup by tag
        //! returns the first matching item.
        class OptionTable {
        public:
            OptionTable();

            //! Append a new option with the given value.
            //! \returns False if the table is full.
            bool append(u8 tag, unsigned len, const void* data);

            //! Shortcuts for appending commonly used option formats.
            //!@{
            bool append_u8(u8 tag, u8 value);
            bool append_u32(u8 tag, u32 value);
            bool append_addr(u8 tag, const leasecat::ip::Addr& addr);
            bool append_addr_list(u8 tag, unsigned count, const leasecat::ip::Addr* list);
            bool append_str(u8 tag, const char* str);
            //!@}

            //! Discard all stored options.
            void clear();

            //! Number of stored options.
            inline unsigned count() const
                { return m_count; }

            //! Fetch the Nth option, or NULL if the index is out of bounds.
            const leasecat::dhcp::Option* at(unsigned idx) const;

            //! Find the first option with the designated tag, or NULL.
            const leasecat::dhcp::Option* find(u8 tag) const;

            //! Write each option in order, not including OPTION_END.
            void write_to(leasecat::io::Writeable* wr) const;

        private:
            // Options hold pointers into m_data, so copies are forbidden.
            OptionTable(const OptionTable&) = delete;
            OptionTable& operator=(const OptionTable&) = delete;

            unsigned m_count;       // Number of stored options
            unsigned m_used;        // Bytes used in m_data
            leasecat::dhcp::Option m_opts[LEASECAT_DHCP_MAX_OPTIONS];
            u8 m_data[LEASECAT_DHCP_OPTION_BYTES];
        };

        //! Decoded contents of a BOOTP/DHCP message.
        class Message {
        public:
            Message();

            //! Decode a complete message from the designated source.
            //! \returns False if the input is too short or is not a DHCP
            //! message (i.e., wrong magic cookie).
            bool read_from(leasecat::io::Readable* rd);

            //! Value of the DHCP message-type option (tag 53).
            //! \returns False if the option is absent or malformed.
            bool message_type(u8& out) const;

            //! Find the first option with the designated tag, or NULL.
            inline const leasecat::dhcp::Option* option(u8 tag) const
                { return m_opts.find(tag); }

            //! Read-only access to the complete list of options.
            inline const leasecat::dhcp::OptionTable& options() const
                { return m_opts; }

            //! Client hardware address (first six bytes of CHADDR).
            leasecat::eth::MacAddr mac() const;

            //! Did the client set the broadcast flag?
            inline bool broadcast() const
                { return (flags & leasecat::dhcp::FLAG_BROADCAST) != 0; }

            // Fixed header fields, in the order they appear on the wire.
            u8 op;                          //!< Request or reply
            u8 htype;                       //!< Hardware address type
            u8 hlen;                        //!< Hardware address length
            u8 hops;                        //!< Relay hop count
            u32 xid;                        //!< Transaction ID
            u16 secs;                       //!< Seconds since client start
            u16 flags;                      //!< Flags (e.g., FLAG_BROADCAST)
            leasecat::ip::Addr ciaddr;      //!< Client address, if bound
            leasecat::ip::Addr yiaddr;      //!< "Your" (offered) address
            leasecat::ip::Addr siaddr;      //!< Next-server address
            leasecat::ip::Addr giaddr;      //!< Relay agent address
            u8 chaddr[CHADDR_LEN];          //!< Client hardware address

        private:
            leasecat::dhcp::OptionTable m_opts;
        };

        //! Contents of an outgoing server reply.
        //!
        //! The reply header is derived from the original request, and the
        //! options are written in the order they were appended, always
        //! preceded by the message-type option and followed by OPTION_END.
        class Reply {
        public:
            Reply();

            //! Discard previous contents and set the message type and
            //! target address (YIADDR) for a new reply.  The optional
            //! client address is written to CIADDR (e.g., for an Ack).
            void reset(u8 msg_type,
                const leasecat::ip::Addr& target,
                const leasecat::ip::Addr& client = leasecat::ip::ADDR_NONE);

            //! Message type of this reply (e.g., DHCP_OFFER), or zero if
            //! no reply is required.
            inline u8 type() const
                { return m_type; }

            //! Target address to be written to the YIADDR field.
            inline leasecat::ip::Addr target() const
                { return m_target; }

            //! Client address to be written to the CIADDR field.
            inline leasecat::ip::Addr client() const
                { return m_client; }

            //! Additional options, written in order after the message type.
            inline leasecat::dhcp::OptionTable& options()
                { return m_opts; }
            inline const leasecat::dhcp::OptionTable& options() const
                { return m_opts; }

            //! Encode the reply to the designated request.
            //! Echoes HTYPE, HLEN, XID, FLAGS, GIADDR, and CHADDR.
            //! \returns True if the complete reply was written.
            bool write_to(
                leasecat::io::Writeable* wr,
                const leasecat::dhcp::Message& req) const;

            //! Total encoded length in bytes, including OPTION_END.
            unsigned length() const;

        private:
            u8 m_type;
            leasecat::ip::Addr m_target;
            leasecat::ip::Addr m_client;
            leasecat::dhcp::OptionTable m_opts;
        };
    }
}
