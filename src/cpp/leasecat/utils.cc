//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <leasecat/utils.h>

namespace util = leasecat::util;

u32 util::extract_be_u32(const u8* src)
{
    return 16777216 * (u32)src[0]
         +    65536 * (u32)src[1]
         +      256 * (u32)src[2]
         +        1 * (u32)src[3];
}

void util::write_be_u32(u8* dst, u32 val)
{
    dst[0] = (u8)(val >> 24);
    dst[1] = (u8)(val >> 16);
    dst[2] = (u8)(val >> 8);
    dst[3] = (u8)(val >> 0);
}

int util::hex_digit(char c)
{
    if ('0' <= c && c <= '9') return c - '0';
    if ('a' <= c && c <= 'f') return c - 'a' + 10;
    if ('A' <= c && c <= 'F') return c - 'A' + 10;
    return -1;
}

unsigned util::parse_dec(const char* str, u64 max, u64& out)
{
    unsigned count = 0;
    u64 value = 0;
    while (str && util::is_digit(str[count])) {
        u64 digit = u64(str[count] - '0');
        if (value > (max - digit) / 10) return 0;   // Overflow
        value = 10 * value + digit;
        ++count;
    }
    if (count) out = value;
    return count;
}
