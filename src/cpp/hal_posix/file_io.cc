//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_io.h>
#include <unistd.h>         // For "ftruncate"

using leasecat::io::FileReader;
using leasecat::io::FileWriter;

FileWriter::FileWriter(const char* filename)
    : m_file(filename ? fopen(filename, "wb") : 0)
    , m_error(false)
{
    // Nothing else to initialize.
}

FileWriter::~FileWriter()
{
    close();
}

void FileWriter::close()
{
    if (m_file && fclose(m_file) != 0) m_error = true;
    m_file = 0;
}

unsigned FileWriter::get_write_space() const
{
    // An open file never runs out of room, as far as we can tell.
    return m_file ? UINT32_MAX : 0;
}

void FileWriter::write_bytes(unsigned nbytes, const void* src)
{
    if (!m_file) {write_overflow(); return;}
    if (fwrite(src, 1, nbytes, m_file) != nbytes) m_error = true;
}

void FileWriter::write_next(u8 data)
{
    if (fputc(data, m_file) == EOF) m_error = true;
}

void FileWriter::write_overflow()
{
    m_error = true;
}

bool FileWriter::write_finalize()
{
    if (!m_file) return false;
    // Flushing here surfaces any deferred I/O error.
    if (fflush(m_file) != 0 || ferror(m_file)) m_error = true;
    close();
    bool ok = !m_error;
    m_error = false;
    return ok;
}

void FileWriter::write_abort()
{
    if (!m_file) return;
    fflush(m_file);
    if (ftruncate(fileno(m_file), 0) != 0) m_error = true;
    rewind(m_file);
}

FileReader::FileReader(const char* filename)
    : m_file(filename ? fopen(filename, "rb") : 0)
    , m_rem(0)
{
    // Measure the file so get_read_ready() is exact.
    if (m_file && fseek(m_file, 0, SEEK_END) == 0) {
        long len = ftell(m_file);
        m_rem = (len > 0) ? (unsigned)len : 0;
        rewind(m_file);
    }
}

FileReader::~FileReader()
{
    close();
}

void FileReader::close()
{
    if (m_file) fclose(m_file);
    m_file = 0;
    m_rem = 0;
}

unsigned FileReader::get_read_ready() const
{
    return m_rem;
}

bool FileReader::read_bytes(unsigned nbytes, void* dst)
{
    if (nbytes > m_rem) {
        read_underflow();
        return false;
    }
    size_t count = fread(dst, 1, nbytes, m_file);
    m_rem -= (unsigned)count;
    return count == nbytes;
}

bool FileReader::read_consume(unsigned nbytes)
{
    if (nbytes > m_rem) {
        read_underflow();
        return false;
    }
    if (fseek(m_file, (long)nbytes, SEEK_CUR) != 0) return false;
    m_rem -= nbytes;
    return true;
}

void FileReader::read_finalize()
{
    close();
}

u8 FileReader::read_next()
{
    // Parent has already checked get_read_ready().
    --m_rem;
    return (u8)fgetc(m_file);
}
