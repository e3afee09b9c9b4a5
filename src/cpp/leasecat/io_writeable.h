//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Byte-stream output for DHCP replies and text files
//!
//! \details
//! Every byte that LeaseCat emits passes through `io::Writeable`: the
//! Reply encoder fills a fixed transmit buffer via `io::ArrayWrite`, and
//! the lease file is rewritten through `io::FileWriter` (hal_posix).
//! Integers are always emitted in network byte order.
//!
//! A sink that runs out of space records the overflow instead of writing
//! a partial value.  The caller learns of the problem from the return
//! value of `write_finalize()`, so a long chain of writes needs only one
//! check at the end.

#pragma once

#include <leasecat/types.h>

namespace leasecat {
    namespace io {
        //! Abstract output stream.
        class Writeable {
        public:
            //! Bytes that can be accepted before overflow.
            //! Every sink MUST implement this method.
            virtual unsigned get_write_space() const = 0;

            //! Network-order integer writes.  If the value does not fit,
            //! nothing is written and write_overflow() is called.
            //!@{
            void write_u8(u8 data);
            void write_u16(u16 data);
            void write_u32(u32 data);
            //!@}

            //! Copy raw bytes, all or nothing.
            virtual void write_bytes(unsigned nbytes, const void* src);

            //! Copy a C-string, excluding its terminator.  Null is ignored.
            void write_str(const char* str);

            //! Close out the current record or packet.
            //! \returns False if any write since the last call overflowed.
            virtual bool write_finalize();

            //! Discard the current record or packet, if the sink allows it.
            virtual void write_abort();

        protected:
            constexpr Writeable() {}
            ~Writeable() {}

            //! Store one byte.  Callers have already checked for space.
            virtual void write_next(u8 data) = 0;

            //! Called when a write would not fit.  Default does nothing.
            virtual void write_overflow();

        private:
            // Shared implementation for the integer writes.
            void write_be(u32 data, unsigned nbytes);
        };

        //! Output stream backed by a caller-owned byte array.
        //! Used for the DHCP transmit buffer.  The finished length is
        //! available from written_len() after a successful finalize.
        class ArrayWrite : public leasecat::io::Writeable {
        public:
            constexpr ArrayWrite(void* dst, unsigned len)
                : m_dst((u8*)dst), m_len(len), m_ovr(false), m_wridx(0), m_wrlen(0) {}

            unsigned get_write_space() const override;
            void write_abort() override;
            bool write_finalize() override;

            //! Start of the backing array.
            const u8* buffer() const
                { return m_dst; }

            //! Length of the last finalized packet, or zero.
            inline unsigned written_len() const
                { return m_wrlen; }

        private:
            void write_next(u8 data) override;
            void write_overflow() override;

            u8* const       m_dst;      // Backing array
            const unsigned  m_len;      // Size of backing array
            bool            m_ovr;      // Overflow since last finalize?
            unsigned        m_wridx;    // Next write position
            unsigned        m_wrlen;    // Length at last finalize
        };
    }
}
