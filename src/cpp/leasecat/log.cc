//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <leasecat/eth_header.h>
#include <leasecat/ip_core.h>
#include <leasecat/log.h>
#include <leasecat/utils.h>

namespace log = leasecat::log;
using leasecat::util::ListCore;
using log::Log;
using log::LogBuffer;

// Head of the list of registered handlers.
static log::EventHandler* g_handlers = 0;

bool log::pre_test_reset() {
    bool clean = (g_handlers == 0);
    g_handlers = 0;
    return clean;
}

log::EventHandler::EventHandler()
    : m_next(0)
{
    ListCore::add(g_handlers, this);
}

#if LEASECAT_ALLOW_DELETION
log::EventHandler::~EventHandler() {
    ListCore::remove(g_handlers, this);
}
#endif

Log::Log(s8 priority)
    : m_priority(priority)
{
    // Message starts empty.
}

Log::Log(s8 priority, const char* str)
    : m_priority(priority)
{
    m_buff.wr_str(str);
}

Log::Log(s8 priority, const char* str1, const char* str2)
    : m_priority(priority)
{
    m_buff.wr_str(str1);
    m_buff.wr_str(": ");
    m_buff.wr_str(str2);
}

Log::~Log() {
    m_buff.m_buff[m_buff.m_wridx] = 0;
    for (log::EventHandler* dst = g_handlers ; dst ; dst = ListCore::next(dst))
        dst->log_event(m_priority, m_buff.m_wridx, m_buff.m_buff);
}

Log& Log::write_hex(u64 val, unsigned ndigits) {
    m_buff.wr_str(" = 0x");
    m_buff.wr_hex(val, ndigits);
    return *this;
}

Log& Log::write(const char* str) {
    m_buff.wr_str(str);
    return *this;
}

Log& Log::write(bool val) {
    m_buff.wr_str(val ? " = 1" : " = 0");
    return *this;
}

Log& Log::write(u8 val)  {return write_hex(val, 2);}
Log& Log::write(u16 val) {return write_hex(val, 4);}
Log& Log::write(u32 val) {return write_hex(val, 8);}
Log& Log::write(u64 val) {return write_hex(val, 16);}

Log& Log::write(const u8* val, unsigned nbytes) {
    m_buff.wr_str(" = 0x");
    for (unsigned a = 0 ; a < nbytes ; ++a)
        m_buff.wr_hex(val[a], 2);
    return *this;
}

Log& Log::write(const leasecat::eth::MacAddr& mac) {
    m_buff.wr_str(" = ");
    mac.log_to(m_buff);
    return *this;
}

Log& Log::write(const leasecat::ip::Addr& ip) {
    m_buff.wr_str(" = ");
    ip.log_to(m_buff);
    return *this;
}

Log& Log::write10(s32 val) {return write10(s64(val));}
Log& Log::write10(u32 val) {return write10(u64(val));}

Log& Log::write10(s64 val) {
    m_buff.wr_str(" = ");
    m_buff.wr_signed(val);
    return *this;
}

Log& Log::write10(u64 val) {
    m_buff.wr_str(" = ");
    m_buff.wr_dec(val);
    return *this;
}

void LogBuffer::wr_char(char ch) {
    if (m_wridx < LEASECAT_LOG_MAXLEN) m_buff[m_wridx++] = ch;
}

void LogBuffer::wr_str(const char* str) {
    while (str && *str && m_wridx < LEASECAT_LOG_MAXLEN)
        m_buff[m_wridx++] = *(str++);
}

void LogBuffer::wr_hex(u64 val, unsigned ndigits) {
    static const char HEX[] = "0123456789ABCDEF";
    while (ndigits--)
        wr_char(HEX[(val >> (4 * ndigits)) & 0xF]);
}

void LogBuffer::wr_dec(u64 val) {
    // Digits are generated least-significant first.
    char tmp[20];
    unsigned ndig = 0;
    do {
        tmp[ndig++] = char('0' + val % 10);
        val /= 10;
    } while (val);
    while (ndig) wr_char(tmp[--ndig]);
}

void LogBuffer::wr_signed(s64 val) {
    wr_char(val < 0 ? '-' : '+');
    wr_dec(leasecat::util::abs_s64(val));
}
