//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <leasecat/dhcp_message.h>
#include <leasecat/log.h>
#include <leasecat/utils.h>

// Enable additional diagnostics? (0/1/2)
static constexpr unsigned DEBUG_VERBOSE = 0;

using leasecat::dhcp::Message;
using leasecat::dhcp::Option;
using leasecat::dhcp::OptionTable;
using leasecat::dhcp::Reply;
using leasecat::io::LimitedRead;
using leasecat::io::Readable;
using leasecat::io::Writeable;
using leasecat::ip::Addr;
using leasecat::log::DEBUG;
using leasecat::log::Log;
using leasecat::util::extract_be_u32;
using leasecat::util::min_unsigned;
using leasecat::util::write_be_u32;
namespace dhcp = leasecat::dhcp;

const char* dhcp::type_label(u8 msg_type) {
    switch (msg_type) {
    case DHCP_DISCOVER: return "Discover";
    case DHCP_OFFER:    return "Offer";
    case DHCP_REQUEST:  return "Request";
    case DHCP_DECLINE:  return "Decline";
    case DHCP_ACK:      return "Ack";
    case DHCP_NAK:      return "Nak";
    case DHCP_RELEASE:  return "Release";
    case DHCP_INFORM:   return "Inform";
    default:            return "Unknown";
    }
}

bool Option::as_u8(u8& out) const {
    if (len != 1) return false;
    out = data[0];
    return true;
}

bool Option::as_u32(u32& out) const {
    if (len != 4) return false;
    out = extract_be_u32(data);
    return true;
}

bool Option::as_addr(Addr& out) const {
    if (len != 4) return false;
    out = Addr(extract_be_u32(data));
    return true;
}

unsigned Option::addr_count() const {
    return (len % 4) ? 0 : (len / 4);
}

Addr Option::addr_at(unsigned idx) const {
    if (idx >= addr_count()) return leasecat::ip::ADDR_NONE;
    return Addr(extract_be_u32(data + 4*idx));
}

unsigned Option::as_text(unsigned dst_size, char* dst) const {
    if (dst_size == 0) return 0;
    unsigned n = min_unsigned(len, dst_size - 1);
    memcpy(dst, data, n);
    dst[n] = 0;
    return n;
}

OptionTable::OptionTable()
    : m_count(0)
    , m_used(0)
{
    // Nothing else to initialize.
}

bool OptionTable::append(u8 tag, unsigned len, const void* data) {
    // PAD and END have no length and are never stored.
    if (tag == OPTION_PAD || tag == OPTION_END) return false;
    if (len > 255) return false;
    if (m_count >= LEASECAT_DHCP_MAX_OPTIONS) return false;
    if (m_used + len > LEASECAT_DHCP_OPTION_BYTES) return false;

    Option& opt = m_opts[m_count++];
    opt.tag  = tag;
    opt.len  = u8(len);
    opt.data = m_data + m_used;
    if (len) memcpy(m_data + m_used, data, len);
    m_used += len;
    return true;
}

bool OptionTable::append_u8(u8 tag, u8 value) {
    return append(tag, 1, &value);
}

bool OptionTable::append_u32(u8 tag, u32 value) {
    u8 tmp[4];
    write_be_u32(tmp, value);
    return append(tag, 4, tmp);
}

bool OptionTable::append_addr(u8 tag, const Addr& addr) {
    return append_u32(tag, addr.value);
}

bool OptionTable::append_addr_list(u8 tag, unsigned count, const Addr* list) {
    // Each option holds at most 63 addresses.
    u8 tmp[252];
    if (count == 0 || count > 63) return false;
    for (unsigned a = 0 ; a < count ; ++a)
        write_be_u32(tmp + 4*a, list[a].value);
    return append(tag, 4*count, tmp);
}

bool OptionTable::append_str(u8 tag, const char* str) {
    if (!str) return false;
    return append(tag, (unsigned)strlen(str), str);
}

void OptionTable::clear() {
    m_count = 0;
    m_used  = 0;
}

const Option* OptionTable::at(unsigned idx) const {
    return (idx < m_count) ? (m_opts + idx) : 0;
}

const Option* OptionTable::find(u8 tag) const {
    for (unsigned a = 0 ; a < m_count ; ++a) {
        if (m_opts[a].tag == tag) return m_opts + a;
    }
    return 0;
}

void OptionTable::write_to(Writeable* wr) const {
    for (unsigned a = 0 ; a < m_count ; ++a) {
        wr->write_u8(m_opts[a].tag);
        wr->write_u8(m_opts[a].len);
        wr->write_bytes(m_opts[a].len, m_opts[a].data);
    }
}

Message::Message()
    : op(0), htype(0), hlen(0), hops(0)
    , xid(0), secs(0), flags(0)
    , ciaddr(), yiaddr(), siaddr(), giaddr()
    , chaddr{}
    , m_opts()
{
    // Nothing else to initialize.
}

bool Message::read_from(Readable* rd) {
    m_opts.clear();

    // Sanity check before we start reading.
    if (rd->get_read_ready() < MIN_BYTES) {
        if (DEBUG_VERBOSE > 0) Log(DEBUG, "DHCP codec: Runt message")
            .write10(rd->get_read_ready());
        return false;
    }

    // Read the fixed BOOTP header, then skip SNAME and FILE.
    op      = rd->read_u8();
    htype   = rd->read_u8();
    hlen    = rd->read_u8();
    hops    = rd->read_u8();
    xid     = rd->read_u32();
    secs    = rd->read_u16();
    flags   = rd->read_u16();
    ciaddr.read_from(rd);
    yiaddr.read_from(rd);
    siaddr.read_from(rd);
    giaddr.read_from(rd);
    rd->read_bytes(CHADDR_LEN, chaddr);
    rd->read_consume(LEGACY_BYTES);

    // Check the "magic cookie" that separates DHCP from plain BOOTP.
    u32 magic = rd->read_u32();
    if (magic != DHCP_MAGIC) {
        if (DEBUG_VERBOSE > 0) Log(DEBUG, "DHCP codec: Bad cookie").write(magic);
        return false;
    }

    // Read each option until we reach the end of the input.
    u8 tmp[255];
    while (rd->get_read_ready()) {
        u8 tag = rd->read_u8();
        if (tag == OPTION_PAD) continue;
        if (tag == OPTION_END) break;
        if (!rd->get_read_ready()) break;           // Missing length
        u8 len = rd->read_u8();
        if (rd->get_read_ready() < len) {
            if (DEBUG_VERBOSE > 0) Log(DEBUG, "DHCP codec: Truncated option")
                .write(tag).write(len);
            break;                                  // Overrun, stop here
        }
        LimitedRead opt(rd, len);
        opt.read_bytes(len, tmp);
        opt.read_finalize();
        // The last slot is held for the message type until it arrives.
        bool hold = (tag != OPTION_MSG_TYPE)
            && (m_opts.count() + 1 >= LEASECAT_DHCP_MAX_OPTIONS)
            && !m_opts.find(OPTION_MSG_TYPE);
        if ((hold || !m_opts.append(tag, len, tmp)) && DEBUG_VERBOSE > 1)
            Log(DEBUG, "DHCP codec: Option dropped").write(tag);
    }

    // Ignore anything after the END marker.
    rd->read_finalize();
    return true;
}

bool Message::message_type(u8& out) const {
    const Option* opt = option(OPTION_MSG_TYPE);
    u8 tmp = 0;
    if (!opt || !opt->as_u8(tmp)) return false;
    if (tmp < DHCP_DISCOVER || tmp > DHCP_INFORM) return false;
    out = tmp;
    return true;
}

leasecat::eth::MacAddr Message::mac() const {
    leasecat::eth::MacAddr tmp;
    memcpy(tmp.addr, chaddr, MACADDR_LEN);
    return tmp;
}

Reply::Reply()
    : m_type(0)
    , m_target()
    , m_client()
    , m_opts()
{
    // Nothing else to initialize.
}

void Reply::reset(u8 msg_type, const Addr& target, const Addr& client) {
    m_type   = msg_type;
    m_target = target;
    m_client = client;
    m_opts.clear();
}

bool Reply::write_to(Writeable* wr, const Message& req) const {
    if (wr->get_write_space() < length()) {
        wr->write_abort();
        return false;
    }

    // Fixed BOOTP header, echoing fields from the request.
    wr->write_u8(OP_REPLY);
    wr->write_u8(req.htype);
    wr->write_u8(req.hlen);
    wr->write_u8(0);                        // Hops
    wr->write_u32(req.xid);
    wr->write_u16(0);                       // Secs
    wr->write_u16(req.flags);
    m_client.write_to(wr);                  // CIADDR
    m_target.write_to(wr);                  // YIADDR
    wr->write_u32(0);                       // SIADDR
    req.giaddr.write_to(wr);                // GIADDR
    wr->write_bytes(CHADDR_LEN, req.chaddr);
    for (unsigned a = 0 ; a < LEGACY_BYTES ; ++a)
        wr->write_u8(0);                    // SNAME + FILE
    wr->write_u32(DHCP_MAGIC);

    // Message type always comes first, then everything else.
    wr->write_u8(OPTION_MSG_TYPE);
    wr->write_u8(1);
    wr->write_u8(m_type);
    m_opts.write_to(wr);
    wr->write_u8(OPTION_END);
    return wr->write_finalize();
}

unsigned Reply::length() const {
    unsigned total = MIN_BYTES + 3 + 1;     // Header, type, END
    for (unsigned a = 0 ; a < m_opts.count() ; ++a)
        total += 2 + m_opts.at(a)->len;
    return total;
}
