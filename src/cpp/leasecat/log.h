//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Diagnostic logging for the LeaseCat DHCP server
//!
//!\details
//! Each `Log` object builds one human-readable message in a fixed-size
//! buffer, then hands it to every registered `log::EventHandler` when it
//! falls out of scope.  Nothing is allocated on the heap, so the DHCP core
//! can log from any context.
//!
//! Calls are chained, so a typical message is a single statement:
//!\code
//!      Log(leasecat::log::INFO, "DHCP server: Ack").write(addr).write(mac);
//!\endcode
//! which prints "DHCP server: Ack = 10.0.0.15 = AA:BB:CC:DD:EE:01".
//!
//! On POSIX platforms, the daemon registers `log::ToConsole`
//! (hal_posix/posix_utils.h).  Unit tests do the same, and then inspect
//! the most recent message.

#pragma once

#include <leasecat/list.h>
#include <leasecat/types.h>

// Maximum length of a single message; longer messages are truncated.
#ifndef LEASECAT_LOG_MAXLEN
#define LEASECAT_LOG_MAXLEN 255
#endif

// Export "Log" and the "LOG_*" priority codes to the global namespace?
#ifndef LEASECAT_LOG_CONCISE
#define LEASECAT_LOG_CONCISE 1
#endif

namespace leasecat {
    namespace log {
        //! Message priority.  Larger values are more severe.
        //!@{
        constexpr s8 DEBUG      = -20;
        constexpr s8 INFO       = -10;
        constexpr s8 WARNING    =   0;
        constexpr s8 ERROR      = +10;
        constexpr s8 CRITICAL   = +20;
        //!@}

        //! Recipient for finished `Log` messages.
        //! Constructing a handler registers it; destroying it unregisters.
        class EventHandler {
        public:
            //! Called once per message, with a null-terminated string.
            virtual void log_event(s8 priority, unsigned nbytes, const char* msg) = 0;
        protected:
            EventHandler();
            ~EventHandler() LEASECAT_OPTIONAL_DTOR;
        private:
            friend leasecat::util::ListCore;
            leasecat::log::EventHandler* m_next;
        };

        //! Fixed-size text buffer behind each `Log` message.
        //! Objects with custom formatting write here from `log_to()`.
        //! Every method silently truncates at LEASECAT_LOG_MAXLEN.
        class LogBuffer final {
        public:
            LogBuffer() : m_wridx(0) {}

            //! Append a null-terminated string.  Null is ignored.
            void wr_str(const char* str);
            //! Append a hexadecimal number with exactly `ndigits` digits.
            void wr_hex(u64 val, unsigned ndigits);
            //! Append an unsigned decimal number.
            void wr_dec(u64 val);
            //! Append a signed decimal number with an explicit sign.
            void wr_signed(s64 val);

            unsigned len() const {return m_wridx;}

        private:
            friend leasecat::log::Log;
            LogBuffer(const LogBuffer&) = delete;
            LogBuffer& operator=(const LogBuffer&) = delete;

            void wr_char(char ch);

            unsigned m_wridx;
            char m_buff[LEASECAT_LOG_MAXLEN+1];
        };

        //! One log message, delivered when the object is destroyed.
        //!
        //! Apart from strings, each `write` adds a " = " separator before
        //! its value.  Integers print as fixed-width hexadecimal with a
        //! "0x" prefix; use `write10` for decimal.  Addresses print in
        //! their usual form ("10.0.0.15", "AA:BB:CC:DD:EE:01").
        class Log final {
        public:
            explicit Log(s8 priority);
            Log(s8 priority, const char* str);
            //! Two-part label, joined as "str1: str2".
            Log(s8 priority, const char* str1, const char* str2);
            ~Log();

            Log& write(const char* str);
            Log& write(bool val);
            Log& write(u8 val);
            Log& write(u16 val);
            Log& write(u32 val);
            Log& write(u64 val);
            Log& write(const u8* val, unsigned nbytes);
            Log& write(const leasecat::eth::MacAddr& mac);
            Log& write(const leasecat::ip::Addr& ip);

            //! Decimal output.  Signed values include a "+" or "-".
            //!@{
            Log& write10(s32 val);
            Log& write10(s64 val);
            Log& write10(u32 val);
            Log& write10(u64 val);
            //!@}

        private:
            Log(const Log&) = delete;
            Log& operator=(const Log&) = delete;

            // Append " = 0x" followed by a hexadecimal value.
            Log& write_hex(u64 val, unsigned ndigits);

            const s8 m_priority;
            leasecat::log::LogBuffer m_buff;
        };

        //! Unregister all handlers before each unit test.
        //! \returns True if no handlers were left over from a prior test.
        bool pre_test_reset();
    }
}

#if LEASECAT_LOG_CONCISE
    using leasecat::log::Log;
    constexpr s8 LOG_DEBUG      = leasecat::log::DEBUG;
    constexpr s8 LOG_INFO       = leasecat::log::INFO;
    constexpr s8 LOG_WARNING    = leasecat::log::WARNING;
    constexpr s8 LOG_ERROR      = leasecat::log::ERROR;
    constexpr s8 LOG_CRITICAL   = leasecat::log::CRITICAL;
#endif
