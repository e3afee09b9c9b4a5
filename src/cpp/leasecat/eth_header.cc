//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <leasecat/eth_header.h>
#include <leasecat/log.h>
#include <leasecat/utils.h>

namespace eth = leasecat::eth;
using eth::MacAddr;
using leasecat::util::hex_digit;

bool MacAddr::operator==(const eth::MacAddr& other) const
{
    return (addr[0] == other.addr[0])
        && (addr[1] == other.addr[1])
        && (addr[2] == other.addr[2])
        && (addr[3] == other.addr[3])
        && (addr[4] == other.addr[4])
        && (addr[5] == other.addr[5]);
}

bool MacAddr::operator<(const eth::MacAddr& other) const
{
    for (unsigned a = 0 ; a < 6 ; ++a) {
        if (addr[a] < other.addr[a]) return true;
        if (addr[a] > other.addr[a]) return false;
    }
    return false;   // All bytes equal
}

bool MacAddr::is_valid() const
{
    return (*this != eth::MACADDR_NONE);
}

void MacAddr::log_to(leasecat::log::LogBuffer& wr) const
{
    for (unsigned a = 0 ; a < 6 ; ++a) {
        if (a > 0) wr.wr_str(":");
        wr.wr_hex(addr[a], 2);
    }
}

bool eth::parse_mac(const char* str, eth::MacAddr& out)
{
    if (!str) return false;
    MacAddr tmp;
    char delim = 0;
    for (unsigned a = 0 ; a < 6 ; ++a) {
        // Delimiter must be consistent throughout the string.
        if (a == 1) {
            delim = *str;
            if (delim != ':' && delim != '-') return false;
        }
        if (a > 0 && *(str++) != delim) return false;
        // Each byte is exactly two hex digits.
        int msb = hex_digit(str[0]);
        int lsb = (msb < 0) ? -1 : hex_digit(str[1]);
        if (msb < 0 || lsb < 0) return false;
        tmp.addr[a] = u8(16 * msb + lsb);
        str += 2;
    }
    if (*str) return false;     // Trailing garbage?
    out = tmp;
    return true;
}
