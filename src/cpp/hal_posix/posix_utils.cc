//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/posix_utils.h>
#include <leasecat/eth_header.h>
#include <leasecat/ip_core.h>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace log = leasecat::log;
using leasecat::io::Readable;
using leasecat::log::ToConsole;
using leasecat::util::PosixClock;

std::string leasecat::io::read_str(Readable* src)
{
    std::string tmp;
    tmp.reserve(src->get_read_ready());
    while (src->get_read_ready())
        tmp.push_back((char)src->read_u8());
    src->read_finalize();
    return tmp;
}

s64 PosixClock::now() const
{
    struct timespec ts;
    if (clock_gettime(CLOCK_REALTIME, &ts) != 0)
        return s64(time(0)) * 1000;     // Fallback, one-second resolution
    return s64(ts.tv_sec) * 1000 + s64(ts.tv_nsec) / 1000000;
}

std::string log::format(const leasecat::eth::MacAddr& addr)
{
    char tmp[18];
    snprintf(tmp, sizeof(tmp), "%02X:%02X:%02X:%02X:%02X:%02X",
        addr.addr[0], addr.addr[1], addr.addr[2],
        addr.addr[3], addr.addr[4], addr.addr[5]);
    return std::string(tmp);
}

std::string log::format(const leasecat::ip::Addr& addr)
{
    char tmp[16];
    snprintf(tmp, sizeof(tmp), "%u.%u.%u.%u",
        unsigned(addr.value >> 24) & 0xFF, unsigned(addr.value >> 16) & 0xFF,
        unsigned(addr.value >> 8) & 0xFF, unsigned(addr.value) & 0xFF);
    return std::string(tmp);
}

// Recognized "log_level" labels.
struct PriorityLabel {
    const char* label;
    s8 priority;
};
static const PriorityLabel PRIORITY_LABELS[] = {
    {"debug",   log::DEBUG},
    {"info",    log::INFO},
    {"warning", log::WARNING},
    {"error",   log::ERROR},
};

bool log::parse_priority(const char* label, s8& out)
{
    if (!label) return false;
    for (const PriorityLabel& item : PRIORITY_LABELS) {
        if (!strcmp(label, item.label)) {out = item.priority; return true;}
    }
    return false;
}

// Fixed-width tag for each priority band.
static const char* console_tag(s8 priority)
{
    if (priority >= log::CRITICAL)  return "CRIT ";
    if (priority >= log::ERROR)     return "ERROR";
    if (priority >= log::WARNING)   return "WARN ";
    if (priority >= log::INFO)      return "INFO ";
    return "DEBUG";
}

ToConsole::ToConsole(s8 threshold)
    : m_threshold(threshold)
    , m_last_msg()
{
    // Nothing else to initialize.
}

bool ToConsole::contains(const char* msg) const
{
    return m_last_msg.find(msg) != std::string::npos;
}

void ToConsole::log_event(s8 priority, unsigned nbytes, const char* msg)
{
    m_last_msg.assign(msg, nbytes);
    if (priority < m_threshold) return;

    // Local time of day, e.g., "2025-03-14 15:09:26".
    char stamp[20] = "";
    time_t now = time(0);
    struct tm local;
    if (localtime_r(&now, &local))
        strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    FILE* dst = (priority >= log::ERROR) ? stderr : stdout;
    fprintf(dst, "%s %s %s\n", stamp, console_tag(priority), msg);
    fflush(dst);
}
