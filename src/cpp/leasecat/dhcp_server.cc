//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <leasecat/datetime.h>
#include <leasecat/dhcp_lease.h>
#include <leasecat/dhcp_server.h>
#include <leasecat/log.h>

// Enable additional diagnostics? (0/1/2)
static constexpr unsigned DEBUG_VERBOSE = 0;

namespace dhcp = leasecat::dhcp;
namespace log = leasecat::log;
using leasecat::datetime::ONE_SECOND;
using leasecat::dhcp::Message;
using leasecat::dhcp::Option;
using leasecat::dhcp::Params;
using leasecat::dhcp::Reply;
using leasecat::dhcp::Server;
using leasecat::eth::MacAddr;
using leasecat::ip::Addr;
using leasecat::ip::ADDR_NONE;

Params::Params()
    : server(ADDR_NONE)
    , netmask()
    , gateway(ADDR_NONE)
    , dns_count(0)
    , dns()
    , lease_secs(86400)
    , strict_server_id(false)
{
    // Nothing else to initialize.
}

Server::Server(const Params& params, dhcp::LeaseStore* store)
    : m_params(params)
    , m_store(store)
{
    // Nothing else to initialize.
}

bool Server::for_this_server(const Message& msg) const {
    const Option* opt = msg.option(dhcp::OPTION_SERVER_ID);
    Addr addr;
    if (!opt || !opt->as_addr(addr)) return true;
    return addr == m_params.server;
}

bool Server::handle(const Message& msg, Reply& reply) {
    reply.reset(0, ADDR_NONE);

    // Replies from other servers are also broadcast; ignore them.
    if (msg.op != dhcp::OP_REQUEST) return false;

    u8 opcode = 0;
    if (!msg.message_type(opcode)) {
        log::Log(log::DEBUG, "DHCP server: Missing message type").write(msg.xid);
        return false;
    }
    if (DEBUG_VERBOSE > 0)
        log::Log(log::DEBUG, "DHCP server: Received", dhcp::type_label(opcode))
            .write(msg.mac());

    // Check whether Request/Release/Decline are meant for another server.
    if (opcode == dhcp::DHCP_REQUEST
     || opcode == dhcp::DHCP_RELEASE
     || opcode == dhcp::DHCP_DECLINE) {
        bool ours = for_this_server(msg);
        if (!ours) {
            log::Log(log::DEBUG, "DHCP server: Server-ID mismatch")
                .write(msg.mac()).write(m_params.strict_server_id);
            if (m_params.strict_server_id) return false;
        }
    }

    switch (opcode) {
    case dhcp::DHCP_DISCOVER:
        return discover(msg, reply);
    case dhcp::DHCP_REQUEST:
        return request(msg, reply);
    case dhcp::DHCP_RELEASE:
    case dhcp::DHCP_DECLINE:
        release(msg);
        return false;
    default:
        log::Log(log::DEBUG, "DHCP server: Message ignored", dhcp::type_label(opcode));
        return false;
    }
}

bool Server::discover(const Message& msg, Reply& reply) {
    MacAddr mac = msg.mac();

    // Prefer the client's existing address, even if expired, then any
    // outstanding offer, before searching the pool.
    Addr addr;
    if (!m_store->current_lease(mac, addr)
     && !m_store->pending_offer(mac, addr)) {
        addr = m_store->allocate(mac);
        if (addr == ADDR_NONE) {
            log::Log(log::WARNING, "DHCP server: Pool exhausted").write(mac);
            return false;
        }
        m_store->remember_offer(mac, addr);
    }

    log::Log(log::INFO, "DHCP server: Offer").write(addr).write(mac);
    grant(reply, dhcp::DHCP_OFFER, addr, ADDR_NONE);
    return true;
}

bool Server::request(const Message& msg, Reply& reply) {
    MacAddr mac = msg.mac();

    // Requested address is option 50 if present, otherwise CIADDR.
    Addr req_addr = msg.ciaddr;
    const Option* opt = msg.option(dhcp::OPTION_REQUEST_IP);
    if (opt) opt->as_addr(req_addr);

    // Re-affirm the client's existing lease, whatever they asked for.
    // Renewal extends the expiry but never shortens it.
    s64 expiry = m_store->now() + s64(m_params.lease_secs) * ONE_SECOND;
    Addr addr;
    if (m_store->current_lease(mac, addr)) {
        const dhcp::Lease* lease = m_store->lookup(addr);
        if (lease && lease->expiry > expiry) expiry = lease->expiry;
        m_store->insert(addr, mac, expiry);
        log::Log(log::INFO, "DHCP server: Ack").write(addr).write(mac);
        grant(reply, dhcp::DHCP_ACK, addr, msg.ciaddr);
        return true;
    }

    // Otherwise, grant the requested address if we can.
    if (!m_store->available(mac, req_addr)) {
        log::Log(log::WARNING, "DHCP server: Nak").write(req_addr).write(mac);
        refuse(reply, dhcp::NAK_UNAVAILABLE);
        return true;
    }

    m_store->insert(req_addr, mac, expiry);
    log::Log(log::INFO, "DHCP server: Ack").write(req_addr).write(mac);
    grant(reply, dhcp::DHCP_ACK, req_addr, msg.ciaddr);
    return true;
}

void Server::release(const Message& msg) {
    MacAddr mac = msg.mac();
    Addr addr;
    if (m_store->current_lease(mac, addr)) {
        log::Log(log::INFO, "DHCP server: Release").write(addr).write(mac);
        m_store->remove(addr);
    }
}

void Server::grant(Reply& reply, u8 type, const Addr& addr, const Addr& client) {
    reply.reset(type, addr, client);
    dhcp::OptionTable& opts = reply.options();
    opts.append_addr(dhcp::OPTION_SERVER_ID, m_params.server);
    opts.append_u32(dhcp::OPTION_LEASE_TIME, m_params.lease_secs);
    opts.append_addr(dhcp::OPTION_SUBNET_MASK, m_params.netmask);
    opts.append_addr_list(dhcp::OPTION_ROUTER, 1, &m_params.gateway);
    if (m_params.dns_count)
        opts.append_addr_list(dhcp::OPTION_DNS_SERVER, m_params.dns_count, m_params.dns);
}

void Server::refuse(Reply& reply, const char* why) {
    reply.reset(dhcp::DHCP_NAK, ADDR_NONE);
    dhcp::OptionTable& opts = reply.options();
    opts.append_addr(dhcp::OPTION_SERVER_ID, m_params.server);
    opts.append_str(dhcp::OPTION_MESSAGE, why);
}
