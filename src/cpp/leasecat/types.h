//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Basic type aliases and prototypes used throughout LeaseCat

#pragma once

#include <cinttypes>

// Allow safe destruction of LeaseCat objects?
// Long-running daemons rarely delete anything, but unit tests do.
// For GCC/G++: compiler flag "-DLEASECAT_ALLOW_DELETION=0" to disable.
#ifndef LEASECAT_ALLOW_DELETION
#define LEASECAT_ALLOW_DELETION  1
#endif

#if LEASECAT_ALLOW_DELETION
#define LEASECAT_OPTIONAL_DTOR       // Full function defined elsewhere
#else
#define LEASECAT_OPTIONAL_DTOR {}    // Null inline placeholder
#endif

// Shortcuts for fixed-size integer types.
typedef uint8_t     u8;
typedef uint16_t    u16;
typedef uint32_t    u32;
typedef uint64_t    u64;
typedef int8_t      s8;
typedef int16_t     s16;
typedef int32_t     s32;
typedef int64_t     s64;

// Prototypes for widely-used interfaces and data-structures.
// (Comment indicates the file containing the full definition.)
namespace leasecat {
    namespace datetime {            // Wall-clock time
        class Clock;                // leasecat/datetime.h
    }

    namespace dhcp {                // DHCP server
        struct Lease;               // leasecat/dhcp_lease.h
        struct Option;              // leasecat/dhcp_message.h
        struct Params;              // leasecat/dhcp_server.h
        class Config;               // hal_posix/dhcp_config.h
        class LeaseFile;            // hal_posix/lease_file.h
        class LeaseStore;           // leasecat/dhcp_lease.h
        class Message;              // leasecat/dhcp_message.h
        class OptionTable;          // leasecat/dhcp_message.h
        class Reply;                // leasecat/dhcp_message.h
        class Server;               // leasecat/dhcp_server.h
        class SocketPosix;          // hal_posix/dhcp_socket.h
    }

    namespace eth {                 // Ethernet hardware addresses
        struct MacAddr;             // leasecat/eth_header.h
    }

    namespace io {                  // Input and output streams
        class ArrayRead;            // leasecat/io_readable.h
        class ArrayWrite;           // leasecat/io_writeable.h
        class FileReader;           // hal_posix/file_io.h
        class FileWriter;           // hal_posix/file_io.h
        class LimitedRead;          // leasecat/io_readable.h
        class Readable;             // leasecat/io_readable.h
        class Writeable;            // leasecat/io_writeable.h
    }

    namespace ip {                  // Internet Protocol v4
        struct Addr;                // leasecat/ip_core.h
        struct Mask;                // leasecat/ip_core.h
        struct Port;                // leasecat/ip_core.h
    }

    namespace log {                 // Logging
        class EventHandler;         // leasecat/log.h
        class Log;                  // leasecat/log.h
        class LogBuffer;            // leasecat/log.h
        class ToConsole;            // hal_posix/posix_utils.h
    }

    namespace util {                // Other utilities
        class ListCore;             // leasecat/list.h
        class PosixClock;           // hal_posix/posix_utils.h
    }
}
