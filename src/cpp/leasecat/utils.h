//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Miscellaneous utility functions
//
// Trivial functions are defined inline for performance optimization.
// All others are defined in "utils.cc".

#pragma once

#include <leasecat/types.h>

namespace leasecat {
    namespace util {
        // Minimum of two arguments.
        inline constexpr unsigned min_unsigned(unsigned a, unsigned b)
            {return (a < b) ? a : b;}

        // Absolute value of a signed integer.
        inline constexpr u64 abs_s64(s64 a)
            {return (a < 0) ? (~u64(a) + 1) : u64(a);}

        // Extract or store a big-endian word in a byte array.
        u32 extract_be_u32(const u8* src);
        void write_be_u32(u8* dst, u32 val);

        // Character-class helper for the text parsers.
        inline constexpr bool is_digit(char c)
            {return '0' <= c && c <= '9';}

        // Convert one hexadecimal digit, or return -1 if invalid.
        int hex_digit(char c);

        // Parse an unsigned decimal integer from the start of a string.
        // Returns the number of characters consumed, or zero on error.
        // Stops at the first non-digit or if the value exceeds "max".
        unsigned parse_dec(const char* str, u64 max, u64& out);
    }
}
