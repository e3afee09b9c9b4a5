//////////////////////////////////////////////////////////////////////////
// Copyright 2021-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_io.h>
#include <hal_test/sim_utils.h>
#include <cerrno>
#include <cstdio>
#include <map>
#include <sys/stat.h>

namespace dhcp = leasecat::dhcp;
namespace log = leasecat::log;
using leasecat::eth::MacAddr;
using leasecat::io::ArrayRead;
using leasecat::io::ArrayWrite;
using leasecat::io::FileReader;
using leasecat::io::FileWriter;
using leasecat::ip::Addr;
using leasecat::test::MockRequest;

std::string leasecat::test::sim_filename(const char* pre, const char* ext) {
    // Persistent counter lookup for each unique prefix.
    static std::map<std::string, unsigned> counts;
    if (counts.find(pre) == counts.end()) counts[pre] = 0;
    unsigned idx = counts[pre]++;
    // Create the output folder if it doesn't already exist.
    if (mkdir("simulations", 0755) && errno != EEXIST)
        log::Log(log::ERROR, "Cannot create simulations folder");
    // Construct the filename and delete any leftovers from a previous run.
    char buff[256];
    snprintf(buff, sizeof(buff), "simulations/%s_%03u.%s", pre, idx, ext);
    std::remove(buff);
    std::string tmp(buff);
    std::remove((tmp + ".tmp").c_str());
    return tmp;
}

bool leasecat::test::write_file(const std::string& filename, const std::string& text) {
    FileWriter wr(filename.c_str());
    wr.write_bytes((unsigned)text.size(), text.c_str());
    return wr.write_finalize();
}

std::string leasecat::test::read_file(const std::string& filename) {
    FileReader rd(filename.c_str());
    return leasecat::io::read_str(&rd);
}

MacAddr leasecat::test::client_mac(u8 idx) {
    MacAddr tmp = {{0xAA, 0xBB, 0xCC, 0xDD, 0xEE, idx}};
    return tmp;
}

MockRequest::MockRequest(u8 msg_type, const MacAddr& mac, u32 xid)
    : m_op(dhcp::OP_REQUEST)
    , m_flags(0)
    , m_xid(xid)
    , m_mac(mac)
    , m_ciaddr(leasecat::ip::ADDR_NONE)
    , m_giaddr(leasecat::ip::ADDR_NONE)
    , m_opts()
{
    m_opts.append_u8(dhcp::OPTION_MSG_TYPE, msg_type);
}

MockRequest& MockRequest::op(u8 op) {
    m_op = op; return *this;
}

MockRequest& MockRequest::broadcast(bool flag) {
    m_flags = flag ? dhcp::FLAG_BROADCAST : 0; return *this;
}

MockRequest& MockRequest::ciaddr(const Addr& addr) {
    m_ciaddr = addr; return *this;
}

MockRequest& MockRequest::giaddr(const Addr& addr) {
    m_giaddr = addr; return *this;
}

MockRequest& MockRequest::requested_ip(const Addr& addr) {
    m_opts.append_addr(dhcp::OPTION_REQUEST_IP, addr); return *this;
}

MockRequest& MockRequest::server_id(const Addr& addr) {
    m_opts.append_addr(dhcp::OPTION_SERVER_ID, addr); return *this;
}

MockRequest& MockRequest::option(u8 tag, unsigned len, const void* data) {
    m_opts.append(tag, len, data); return *this;
}

std::string MockRequest::bytes() const {
    u8 buff[1500];
    ArrayWrite wr(buff, sizeof(buff));
    wr.write_u8(m_op);
    wr.write_u8(1);                         // HTYPE = Ethernet
    wr.write_u8(6);                         // HLEN
    wr.write_u8(0);                         // HOPS
    wr.write_u32(m_xid);
    wr.write_u16(0);                        // SECS
    wr.write_u16(m_flags);
    m_ciaddr.write_to(&wr);
    wr.write_u32(0);                        // YIADDR
    wr.write_u32(0);                        // SIADDR
    m_giaddr.write_to(&wr);
    m_mac.write_to(&wr);                    // CHADDR
    for (unsigned a = dhcp::MACADDR_LEN ; a < dhcp::CHADDR_LEN ; ++a)
        wr.write_u8(0);
    for (unsigned a = 0 ; a < dhcp::LEGACY_BYTES ; ++a)
        wr.write_u8(0);
    wr.write_u32(dhcp::DHCP_MAGIC);
    m_opts.write_to(&wr);
    wr.write_u8(dhcp::OPTION_END);
    wr.write_finalize();
    return std::string((const char*)buff, wr.written_len());
}

bool MockRequest::decode(dhcp::Message& msg) const {
    std::string tmp = bytes();
    ArrayRead rd(tmp.data(), (unsigned)tmp.size());
    return msg.read_from(&rd);
}

std::string leasecat::test::encode(const dhcp::Reply& reply, const dhcp::Message& req) {
    u8 buff[1500];
    ArrayWrite wr(buff, sizeof(buff));
    if (!reply.write_to(&wr, req)) return std::string();
    return std::string((const char*)buff, wr.written_len());
}
