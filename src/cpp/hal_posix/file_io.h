//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Byte-stream adapters for ordinary files
//
// The configuration file, the lease file, and the static reservation
// table are all read with FileReader.  The lease file is written with
// FileWriter, one complete snapshot per call to write_finalize().

#pragma once

#include <cstdio>
#include <leasecat/io_readable.h>
#include <leasecat/io_writeable.h>

namespace leasecat {
    namespace io {
        //! Writeable stream that creates or truncates a file.
        class FileWriter : public leasecat::io::Writeable {
        public:
            //! Open the named file for writing.  Check is_open().
            explicit FileWriter(const char* filename);
            ~FileWriter();

            inline bool is_open() const
                { return m_file != 0; }

            unsigned get_write_space() const override;
            void write_bytes(unsigned nbytes, const void* src) override;

            //! Flush and close the file.
            //! \returns False if any write failed, or nothing was open.
            bool write_finalize() override;

            //! Discard everything written so far and start over.
            void write_abort() override;

        private:
            void write_next(u8 data) override;
            void write_overflow() override;
            void close();

            FILE* m_file;       // Null once closed
            bool m_error;       // Any failed write since opening?
        };

        //! Readable stream over the complete contents of a file.
        class FileReader : public leasecat::io::Readable {
        public:
            //! Open the named file for reading.  Check is_open().
            explicit FileReader(const char* filename);
            ~FileReader();

            inline bool is_open() const
                { return m_file != 0; }

            unsigned get_read_ready() const override;
            bool read_bytes(unsigned nbytes, void* dst) override;
            bool read_consume(unsigned nbytes) override;

            //! Close the file; no further data is available.
            void read_finalize() override;

        private:
            u8 read_next() override;
            void close();

            FILE* m_file;       // Null once closed
            unsigned m_rem;     // Bytes not yet read
        };
    }
}
