//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Miscellaneous simulation and test helper functions.
//!
//!\details
//! This file contains a variety of "small" utilities used in simulations
//! and unit tests.  Anything that requires more than a few lines of code
//! should generally be moved into its own file.

#pragma once

#include <hal_posix/posix_utils.h>
#include <leasecat/datetime.h>
#include <leasecat/dhcp_message.h>
#include <leasecat/log.h>
#include <string>

//! Macro for making a std::string from a byte-array.
//! Note: Only works for locally defined constants.
#define LEASECAT_MAKE_STRING(x) (std::string(x, x + sizeof(x)))

//! Boilerplate for configuring each unit test.
//! Includes a hard-reset of LeaseCat global variables and enables log::ToConsole.
//! An error in this macro indicates the *previous* test didn't exit cleanly.
#define LEASECAT_TEST_START \
    CHECK(leasecat::log::pre_test_reset()); \
    leasecat::log::ToConsole log;

namespace leasecat {
    namespace test {
        //! Generate a unique filename for storing unit-test results.
        //! Output is "simulations/[pre]_[###].[ext]".
        //! (Where ### is a sequential counter for each unique "pre" value.)
        //! Any stale file with the same name is deleted.
        std::string sim_filename(const char* pre, const char* ext);

        //! Write a string to the designated file, replacing its contents.
        bool write_file(const std::string& filename, const std::string& text);

        //! Read the contents of the designated file, or an empty string.
        std::string read_file(const std::string& filename);

        //! Settable clock for unit tests.
        class MockClock final : public leasecat::datetime::Clock {
        public:
            explicit MockClock(s64 now = 1700000000000LL) : m_now(now) {}
            s64 now() const override {return m_now;}
            inline void set(s64 now) {m_now = now;}
            inline void advance(s64 msec) {m_now += msec;}
        protected:
            s64 m_now;
        };

        //! Shortcut for a locally administered MAC address ending in "idx".
        leasecat::eth::MacAddr client_mac(u8 idx);

        //! Builder for client-to-server DHCP messages.
        //! Setters may be chained, e.g.:
        //!     MockRequest(DHCP_REQUEST, mac).requested_ip(addr).decode(msg)
        class MockRequest {
        public:
            //! Create a message with the given type and hardware address.
            MockRequest(u8 msg_type, const leasecat::eth::MacAddr& mac, u32 xid = 0x12345678);

            //! Optional header fields.
            //!@{
            MockRequest& op(u8 op);
            MockRequest& broadcast(bool flag);
            MockRequest& ciaddr(const leasecat::ip::Addr& addr);
            MockRequest& giaddr(const leasecat::ip::Addr& addr);
            //!@}

            //! Optional options.
            //!@{
            MockRequest& requested_ip(const leasecat::ip::Addr& addr);
            MockRequest& server_id(const leasecat::ip::Addr& addr);
            MockRequest& option(u8 tag, unsigned len, const void* data);
            //!@}

            //! Encode the complete message, including OPTION_END.
            std::string bytes() const;

            //! Encode the message, then decode it.
            bool decode(leasecat::dhcp::Message& msg) const;

        protected:
            u8 m_op;
            u16 m_flags;
            u32 m_xid;
            leasecat::eth::MacAddr m_mac;
            leasecat::ip::Addr m_ciaddr;
            leasecat::ip::Addr m_giaddr;
            leasecat::dhcp::OptionTable m_opts;
        };

        //! Encode a reply to the designated request.
        std::string encode(
            const leasecat::dhcp::Reply& reply,
            const leasecat::dhcp::Message& req);
    }
}
