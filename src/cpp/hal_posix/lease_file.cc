//////////////////////////////////////////////////////////////////////////
// Copyright 2023-2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_io.h>
#include <hal_posix/lease_file.h>
#include <hal_posix/posix_utils.h>
#include <leasecat/log.h>
#include <leasecat/utils.h>
#include <cstdio>
#include <sstream>

namespace log = leasecat::log;
using leasecat::dhcp::Lease;
using leasecat::dhcp::LeaseFile;
using leasecat::eth::MacAddr;
using leasecat::io::FileReader;
using leasecat::io::FileWriter;
using leasecat::ip::Addr;
using leasecat::util::parse_dec;

// Maximum line length in either input file.
static constexpr unsigned MAX_LINE = 256;

// Remove leading and trailing whitespace.
static std::string trim(const std::string& str)
{
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// Parse one line of the persistence file.
static bool parse_lease(const std::string& line, Addr& addr, Lease& lease)
{
    std::istringstream tok(line);
    std::string ip_str, mac_str, exp_str, extra;
    if (!(tok >> ip_str >> mac_str >> exp_str)) return false;
    if (tok >> extra) return false;     // Trailing garbage?
    u64 expiry = 0;
    if (!leasecat::ip::parse_addr(ip_str.c_str(), addr)) return false;
    if (!leasecat::eth::parse_mac(mac_str.c_str(), lease.mac)) return false;
    if (parse_dec(exp_str.c_str(), INT64_MAX, expiry) != exp_str.size()) return false;
    lease.expiry = s64(expiry);
    return true;
}

LeaseFile::LeaseFile(
        const leasecat::datetime::Clock* clock,
        const Addr& start, const Addr& end,
        const char* filename)
    : LeaseStore(clock, start, end)
    , m_filename(filename ? filename : "")
    , m_table()
{
    // Nothing else to initialize.
}

bool LeaseFile::load()
{
    m_table.clear();
    reset_cursor();

    // A missing file is normal on first startup.
    FileReader rd(m_filename.empty() ? 0 : m_filename.c_str());
    if (!rd.is_open()) {
        log::Log(log::INFO, "Lease file: Not found", m_filename.c_str());
        return true;
    }

    // Read each line, stopping at the first error.
    char buff[MAX_LINE];
    unsigned line_num = 0;
    while (rd.read_line(sizeof(buff), buff)) {
        ++line_num;
        std::string line = trim(buff);
        if (line.empty() || line[0] == '#') continue;
        Addr addr;
        Lease lease;
        if (!parse_lease(line, addr, lease)) {
            log::Log(log::WARNING, "Lease file: Malformed, discarded", m_filename.c_str())
                .write10(line_num);
            m_table.clear();
            reset_cursor();
            return false;
        }
        m_table[addr] = lease;
    }

    reset_cursor();
    log::Log(log::INFO, "Lease file: Loaded", m_filename.c_str())
        .write10(count());
    return true;
}

unsigned LeaseFile::load_static(const char* filename)
{
    FileReader rd(filename);
    if (!rd.is_open()) {
        log::Log(log::WARNING, "Static leases: Not found", filename);
        return 0;
    }

    // Each reservation expires long after any realistic lease.
    s64 expiry = now() + leasecat::dhcp::LEASE_STATIC;

    char buff[MAX_LINE];
    unsigned line_num = 0, loaded = 0;
    while (rd.read_line(sizeof(buff), buff)) {
        ++line_num;
        std::string line = trim(buff);
        if (line.empty() || line[0] == '#') continue;
        size_t comma = line.find(',');
        Addr addr;
        MacAddr mac;
        bool ok = (comma != std::string::npos)
            && leasecat::eth::parse_mac(trim(line.substr(0, comma)).c_str(), mac)
            && leasecat::ip::parse_addr(trim(line.substr(comma + 1)).c_str(), addr)
            && mac.is_valid() && addr.is_valid();
        if (!ok) {
            log::Log(log::WARNING, "Static leases: Skipped line", filename)
                .write10(line_num);
            continue;
        }
        Lease lease = {mac, expiry};
        m_table[addr] = lease;
        ++loaded;
    }

    reset_cursor();
    log::Log(log::INFO, "Static leases: Loaded", filename).write10(loaded);
    return loaded;
}

void LeaseFile::clear()
{
    m_table.clear();
    reset_cursor();
}

const Lease* LeaseFile::lookup(const Addr& addr) const
{
    auto it = m_table.find(addr);
    return (it == m_table.end()) ? 0 : &it->second;
}

bool LeaseFile::lookup_mac(const MacAddr& mac, Addr& out) const
{
    // Linear scan in ascending address order.
    for (auto it = m_table.begin() ; it != m_table.end() ; ++it) {
        if (it->second.mac == mac) {
            out = it->first;
            return true;
        }
    }
    return false;
}

unsigned LeaseFile::count() const
{
    return (unsigned)m_table.size();
}

bool LeaseFile::persist()
{
    if (m_filename.empty()) return true;

    // Write the complete table to a temporary file.
    std::string tmp_name = m_filename + ".tmp";
    FileWriter wr(tmp_name.c_str());
    if (!wr.is_open()) {
        log::Log(log::ERROR, "Lease file: Cannot open", tmp_name.c_str());
        return false;
    }
    wr.write_str("# LeaseCat lease table: <ipv4> <hwaddr> <expiry-msec>\n");
    for (auto it = m_table.begin() ; it != m_table.end() ; ++it) {
        char tmp[32];
        snprintf(tmp, sizeof(tmp), " %lld\n", (long long)it->second.expiry);
        wr.write_str(log::format(it->first).c_str());
        wr.write_str(" ");
        wr.write_str(log::format(it->second.mac).c_str());
        wr.write_str(tmp);
    }
    bool ok = wr.write_finalize();

    // Replace the original file only if the write was successful.
    if (ok && std::rename(tmp_name.c_str(), m_filename.c_str()) != 0) ok = false;
    if (ok) {
        log::Log(log::INFO, "Lease file: Saved", m_filename.c_str())
            .write10(count());
    } else {
        log::Log(log::ERROR, "Lease file: Save failed", m_filename.c_str());
        std::remove(tmp_name.c_str());
    }
    return ok;
}

void LeaseFile::update(const Addr& addr, const Lease& lease)
{
    m_table[addr] = lease;
}

void LeaseFile::erase(const Addr& addr)
{
    m_table.erase(addr);
}
