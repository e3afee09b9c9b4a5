//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <leasecat/io_writeable.h>

using leasecat::io::ArrayWrite;
using leasecat::io::Writeable;

void Writeable::write_be(u32 data, unsigned nbytes) {
    if (get_write_space() < nbytes) {
        write_overflow();
        return;
    }
    for (unsigned shift = 8 * nbytes ; shift ; ) {
        shift -= 8;
        write_next((u8)(data >> shift));
    }
}

void Writeable::write_u8(u8 data)   {write_be(data, 1);}
void Writeable::write_u16(u16 data) {write_be(data, 2);}
void Writeable::write_u32(u32 data) {write_be(data, 4);}

void Writeable::write_bytes(unsigned nbytes, const void* src) {
    if (get_write_space() < nbytes) {
        write_overflow();
        return;
    }
    const u8* next = (const u8*)src;
    const u8* last = next + nbytes;
    while (next != last) write_next(*next++);
}

void Writeable::write_str(const char* str) {
    if (str) write_bytes((unsigned)strlen(str), str);
}

bool Writeable::write_finalize()    {return true;}
void Writeable::write_abort()       {}
void Writeable::write_overflow()    {}

unsigned ArrayWrite::get_write_space() const {
    return m_len - m_wridx;
}

void ArrayWrite::write_abort() {
    m_ovr = false;
    m_wridx = 0;
    m_wrlen = 0;
}

bool ArrayWrite::write_finalize() {
    // An overflow anywhere in the packet invalidates all of it.
    bool ok = !m_ovr;
    m_wrlen = ok ? m_wridx : 0;
    m_wridx = 0;
    m_ovr = false;
    return ok;
}

void ArrayWrite::write_overflow() {
    m_ovr = true;
}

void ArrayWrite::write_next(u8 data) {
    m_wrlen = 0;    // Previous packet is now stale
    m_dst[m_wridx++] = data;
}
