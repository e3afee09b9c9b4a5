//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <leasecat/ip_core.h>
#include <leasecat/log.h>
#include <leasecat/utils.h>

using leasecat::ip::Addr;
using leasecat::ip::Mask;
using leasecat::util::parse_dec;

void Addr::log_to(leasecat::log::LogBuffer& wr) const {
    // Convention is 4 decimal numbers with "." delimiter.
    // e.g., "192.168.1.42"
    for (unsigned a = 0 ; a < 4 ; ++a) {
        if (a) wr.wr_str(".");
        wr.wr_dec((value >> (24 - 8*a)) & 0xFF);
    }
}

bool Addr::is_valid() const {
    return value != 0;
}

bool leasecat::ip::parse_addr(const char* str, Addr& out) {
    if (!str) return false;
    u32 result = 0;
    for (unsigned a = 0 ; a < 4 ; ++a) {
        // Each field is 1-3 decimal digits, separated by "."
        if (a && *(str++) != '.') return false;
        u64 field = 0;
        unsigned len = parse_dec(str, 255, field);
        if (len == 0 || len > 3) return false;
        result = (result << 8) | u32(field);
        str += len;
    }
    if (*str) return false;     // Trailing garbage?
    out = Addr(result);
    return true;
}

bool Mask::is_cidr() const {
    // A contiguous mask, once inverted, is of the form 2^N - 1.
    u32 inv = ~value;
    return (inv & (inv + 1)) == 0;
}
