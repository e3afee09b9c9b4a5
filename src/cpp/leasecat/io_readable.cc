//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <leasecat/io_readable.h>
#include <leasecat/utils.h>

using leasecat::io::ArrayRead;
using leasecat::io::LimitedRead;
using leasecat::io::Readable;
using leasecat::util::min_unsigned;

u32 Readable::read_be(unsigned nbytes) {
    if (get_read_ready() < nbytes) {
        read_underflow();
        return 0;
    }
    u32 value = 0;
    while (nbytes--) value = (value << 8) | read_next();
    return value;
}

u8 Readable::read_u8()      {return (u8)read_be(1);}
u16 Readable::read_u16()    {return (u16)read_be(2);}
u32 Readable::read_u32()    {return read_be(4);}

bool Readable::read_bytes(unsigned nbytes, void* dst) {
    if (get_read_ready() < nbytes) {
        read_underflow();
        return false;
    }
    u8* next = (u8*)dst;
    for (unsigned a = 0 ; a < nbytes ; ++a) next[a] = read_next();
    return true;
}

bool Readable::read_consume(unsigned nbytes) {
    if (get_read_ready() < nbytes) {
        read_underflow();
        return false;
    }
    for (unsigned a = 0 ; a < nbytes ; ++a) read_next();
    return true;
}

bool Readable::read_line(unsigned dst_size, char* dst) {
    if (get_read_ready() == 0) return false;
    unsigned len = 0;
    while (get_read_ready()) {
        char ch = (char)read_next();
        if (ch == '\n') break;
        if (len + 1 < dst_size) dst[len++] = ch;
    }
    if (len > 0 && dst[len-1] == '\r') --len;
    dst[len] = 0;
    return true;
}

void Readable::read_finalize()    {}
void Readable::read_underflow()   {}

unsigned ArrayRead::get_read_ready() const {
    return m_len - m_rdidx;
}

bool ArrayRead::read_bytes(unsigned nbytes, void* dst) {
    if (get_read_ready() < nbytes) {
        read_underflow();
        return false;
    }
    memcpy(dst, m_src + m_rdidx, nbytes);
    m_rdidx += nbytes;
    return true;
}

u8 ArrayRead::read_next() {
    return m_src[m_rdidx++];
}

void ArrayRead::read_finalize() {
    m_rdidx = 0;
}

unsigned LimitedRead::get_read_ready() const {
    return min_unsigned(m_rem, m_src->get_read_ready());
}

bool LimitedRead::read_bytes(unsigned nbytes, void* dst) {
    // Overrunning the window also closes it.
    if (nbytes > m_rem) {
        m_rem = 0;
        return false;
    }
    m_rem -= nbytes;
    return m_src->read_bytes(nbytes, dst);
}

bool LimitedRead::read_consume(unsigned nbytes) {
    if (nbytes > m_rem) {
        m_rem = 0;
        return false;
    }
    m_rem -= nbytes;
    return m_src->read_consume(nbytes);
}

void LimitedRead::read_finalize() {
    read_consume(get_read_ready());
    m_rem = 0;
}

u8 LimitedRead::read_next() {
    --m_rem;
    return m_src->read_next();
}
