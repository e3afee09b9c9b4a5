//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Byte-stream input for DHCP requests and text files
//!
//! \details
//! The DHCP codec, the configuration loader, and the lease-file parser
//! all consume input through `io::Readable`, whether it comes from a
//! socket buffer (`io::ArrayRead`), a file (`io::FileReader`), or a
//! unit-test string.  Integers are always read in network byte order.
//!
//! Reading past the end of the input is never fatal: the read returns
//! zero (or false) and the stream's read_underflow() hook is called.

#pragma once

#include <leasecat/types.h>

namespace leasecat {
    namespace io {
        //! Abstract input stream.
        class Readable {
        public:
            //! Bytes that can be read before underflow.
            //! Every source MUST implement this method.
            virtual unsigned get_read_ready() const = 0;

            //! Network-order integer reads.  Return zero on underflow.
            //!@{
            u8 read_u8();
            u16 read_u16();
            u32 read_u32();
            //!@}

            //! Copy the next N bytes, all or nothing.
            virtual bool read_bytes(unsigned nbytes, void* dst);

            //! Skip the next N bytes, all or nothing.
            virtual bool read_consume(unsigned nbytes);

            //! Read one line of text, excluding the newline and any
            //! trailing carriage-return.  Long lines are truncated to fit
            //! `dst`, but are always consumed in full.
            //! \returns False if no input remains.
            bool read_line(unsigned dst_size, char* dst);

            //! Done with the current packet or file.
            virtual void read_finalize();

        protected:
            friend leasecat::io::LimitedRead;

            constexpr Readable() {}
            ~Readable() {}

            //! Fetch one byte.  Callers have already checked for data.
            virtual u8 read_next() = 0;

            //! Called when a read would run past the end.  Default does nothing.
            virtual void read_underflow();

        private:
            // Shared implementation for the integer reads.
            u32 read_be(unsigned nbytes);
        };

        //! Input stream over a caller-owned byte array, such as the
        //! receive buffer of a UDP socket.  read_finalize() rewinds to
        //! the start of the array.
        class ArrayRead : public leasecat::io::Readable {
        public:
            //! Either argument order is accepted.
            //!@{
            constexpr ArrayRead(const void* src, unsigned len)
                : m_src((const u8*)src), m_len(len), m_rdidx(0) {}
            constexpr ArrayRead(unsigned len, const void* src)
                : m_src((const u8*)src), m_len(len), m_rdidx(0) {}
            //!@}

            unsigned get_read_ready() const override;
            bool read_bytes(unsigned nbytes, void* dst) override;
            void read_finalize() override;

        private:
            u8 read_next() override;

            const u8* const m_src;  // Backing array
            const unsigned m_len;   // Size of backing array
            unsigned m_rdidx;       // Next read position
        };

        //! Window onto the next N bytes of another stream.
        //! The DHCP codec uses one of these for each option's value, so a
        //! malformed option can never read into its neighbor.  Calling
        //! read_finalize() skips whatever is left of the window.
        class LimitedRead : public leasecat::io::Readable {
        public:
            constexpr LimitedRead(leasecat::io::Readable* src, unsigned maxrd)
                : m_src(src), m_rem(maxrd) {}

            unsigned get_read_ready() const override;
            bool read_bytes(unsigned nbytes, void* dst) override;
            bool read_consume(unsigned nbytes) override;
            void read_finalize() override;

        protected:
            u8 read_next() override;

        private:
            leasecat::io::Readable* const m_src;
            unsigned m_rem;         // Bytes left in the window
        };
    }
}
