//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cerrno>
#include <cstring>
#include <hal_posix/dhcp_socket.h>
#include <leasecat/dhcp_server.h>
#include <leasecat/log.h>

#include <arpa/inet.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#define CLOSE_SOCKET(x) {::close(x); x = -1;}

namespace dhcp = leasecat::dhcp;
namespace log = leasecat::log;
using leasecat::dhcp::Message;
using leasecat::dhcp::Reply;
using leasecat::dhcp::SocketPosix;
using leasecat::io::ArrayRead;
using leasecat::io::ArrayWrite;
using leasecat::ip::Addr;
using leasecat::ip::Port;

// Enable additional diagnostics? (0/1/2)
static constexpr unsigned DEBUG_VERBOSE = 0;

// Shortcut for printing a network error message.
static void log_socket_error(const char* label) {
    int err_code = errno;
    const char* err_msg = strerror(err_code);
    log::Log(log::ERROR, "DHCP socket: ")
        .write(label).write10(err_code).write("\r\n  ").write(err_msg);
}

SocketPosix::SocketPosix(
        dhcp::Server* server, const Addr& broadcast,
        const Port& server_port, const Port& client_port)
    : m_server(server)
    , m_broadcast(broadcast)
    , m_server_port(server_port)
    , m_client_port(client_port)
    , m_sock(-1)
    , m_count_rcvd(0)
    , m_count_sent(0)
    , m_count_drop(0)
{
    // Nothing else to initialize.
}

SocketPosix::~SocketPosix() {
    close();
}

void SocketPosix::close() {
    if (m_sock >= 0) CLOSE_SOCKET(m_sock);
}

bool SocketPosix::bind(const char* intf) {
    // Sanity checks before we start...
    close();

    // Setup request information.
    struct sockaddr_in request;
    memset(&request, 0, sizeof(request));
    request.sin_family = AF_INET;
    request.sin_addr.s_addr = INADDR_ANY;
    request.sin_port = htons(m_server_port.value);

    // Open the socket.
    m_sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (m_sock < 0) {
        log_socket_error("socket");
        return false;
    }

    // Attempt to set the REUSEADDR flag to allow server restarts.
    // This is nonessential, so ignore errors in this operation.
    const int enable = 1;
    setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

    // Most replies are broadcast, so this flag is essential.
    if (setsockopt(m_sock, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable))) {
        log_socket_error("broadcast");
        close(); return false;
    }

    // Optionally restrict traffic to a single interface.
    // This usually requires elevated privileges, so failure is a warning.
    if (intf && intf[0]) {
        int err = setsockopt(m_sock, SOL_SOCKET, SO_BINDTODEVICE,
            intf, (socklen_t)strlen(intf));
        if (err) log::Log(log::WARNING, "DHCP socket: Cannot bind to device", intf)
            .write10((s32)errno);
    }

    // Attempt to bind to the requested port.
    int err = ::bind(m_sock, (const sockaddr*)&request, sizeof(request));
    if (err) {
        log_socket_error("bind");
        close(); return false;
    }

    log::Log(log::INFO, "DHCP socket: Listening on port")
        .write10((u32)m_server_port.value);
    return true;
}

bool SocketPosix::service_once(unsigned timeout_msec) {
    if (m_sock < 0) return false;

    // Optional timeout, otherwise wait forever.
    if (timeout_msec) {
        fd_set query;
        FD_ZERO(&query);
        FD_SET(m_sock, &query);
        timeval tv;
        tv.tv_sec  = timeout_msec / 1000;
        tv.tv_usec = 1000 * (timeout_msec % 1000);
        int count = select(m_sock+1, &query, nullptr, nullptr, &tv);
        if (count < 0 && errno != EINTR) log_socket_error("select");
        if (count <= 0) return false;
    }

    // Read the next datagram.
    ssize_t rcvd = recvfrom(m_sock, m_rxbuff, sizeof(m_rxbuff), 0, nullptr, nullptr);
    if (rcvd < 0) {
        if (errno != EINTR) log_socket_error("recv");
        return false;
    }

    ++m_count_rcvd;
    process((unsigned)rcvd);
    return true;
}

void SocketPosix::run() {
    while (m_sock >= 0) service_once();
}

void SocketPosix::destination(
    const Message& req, const Reply& reply,
    Addr& dst_addr, Port& dst_port) const
{
    // See also: RFC2131 Section 4.1.
    if (req.broadcast() || !req.ciaddr.is_valid() || !reply.target().is_valid()) {
        dst_addr = m_broadcast;
        dst_port = m_client_port;
    } else if (req.giaddr.is_valid()) {
        dst_addr = req.giaddr;
        dst_port = m_server_port;
    } else {
        dst_addr = reply.target();
        dst_port = m_client_port;
    }
}

void SocketPosix::process(unsigned nbytes) {
    // Decode the incoming message, silently dropping invalid packets.
    Message req;
    ArrayRead rd(m_rxbuff, nbytes);
    if (!req.read_from(&rd)) {
        ++m_count_drop;
        log::Log(log::DEBUG, "DHCP socket: Malformed packet").write10(nbytes);
        return;
    }

    // Let the state machine decide how to respond.
    Reply reply;
    if (!m_server->handle(req, reply)) return;

    // Encode the reply.
    ArrayWrite wr(m_txbuff, sizeof(m_txbuff));
    if (!reply.write_to(&wr, req)) {
        log::Log(log::ERROR, "DHCP socket: Reply overflow");
        return;
    }

    // Send it to the selected destination.
    Addr dst_addr;
    Port dst_port(m_client_port);
    destination(req, reply, dst_addr, dst_port);
    struct sockaddr_in dst;
    memset(&dst, 0, sizeof(dst));
    dst.sin_family = AF_INET;
    dst.sin_addr.s_addr = htonl(dst_addr.value);
    dst.sin_port = htons(dst_port.value);
    ssize_t sent = sendto(m_sock, m_txbuff, wr.written_len(), 0,
        (const sockaddr*)&dst, sizeof(dst));
    if (sent < 0) {
        log_socket_error("send");
    } else {
        ++m_count_sent;
        if (DEBUG_VERBOSE > 0) log::Log(log::DEBUG, "DHCP socket: Sent")
            .write(dst_addr).write10((u32)dst_port.value);
    }
}
