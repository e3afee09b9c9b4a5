//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! POSIX services for the DHCP daemon: wall clock and console logging
//! \details
//! The "leasecat" core never reads the system clock, never prints, and
//! never allocates.  This file supplies those services on POSIX hosts,
//! along with a few std::string conveniences for files and unit tests.

#pragma once

#include <leasecat/datetime.h>
#include <leasecat/io_readable.h>
#include <leasecat/log.h>
#include <string>

namespace leasecat {
    namespace io {
        //! Drain a Readable stream into a string.
        std::string read_str(leasecat::io::Readable* src);
    }

    namespace util {
        //! Lease-expiry clock based on CLOCK_REALTIME.
        class PosixClock final : public leasecat::datetime::Clock {
        public:
            PosixClock() {}
            s64 now() const override;
        };
    }

    namespace log {
        //! Address formatting for the lease file and unit tests.
        //!@{
        std::string format(const leasecat::eth::MacAddr& addr);
        std::string format(const leasecat::ip::Addr& addr);
        //!@}

        //! Parse a "log_level" value: "debug", "info", "warning", or "error".
        bool parse_priority(const char* label, s8& out);

        //! Prints each Log message with a local timestamp and priority
        //! label.  ERROR and above go to stderr, the rest to stdout.
        //!
        //! Every message is also kept in `m_last_msg`, regardless of the
        //! threshold, so unit tests can inspect it.
        class ToConsole final : public leasecat::log::EventHandler {
        public:
            explicit ToConsole(s8 threshold=leasecat::log::DEBUG);

            //! Stop printing.  Messages are still recorded.
            void disable() {m_threshold = INT8_MAX;}

            //! Does the most recent message contain this substring?
            bool contains(const char* msg) const;

            void clear() {m_last_msg.clear();}
            bool empty() const {return m_last_msg.empty();}

            s8 m_threshold;             //!< Minimum priority to print
            std::string m_last_msg;     //!< Most recent message

        private:
            void log_event(s8 priority, unsigned nbytes, const char* msg) override;
        };
    }
}
