//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of LeaseCat, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cstring>
#include <hal_posix/dhcp_config.h>
#include <hal_posix/file_io.h>
#include <hal_posix/posix_utils.h>
#include <leasecat/log.h>
#include <leasecat/utils.h>

namespace dhcp = leasecat::dhcp;
namespace log = leasecat::log;
using leasecat::dhcp::Config;
using leasecat::dhcp::Params;
using leasecat::io::FileReader;
using leasecat::io::Readable;
using leasecat::ip::Addr;
using leasecat::util::parse_dec;

// Maximum length of a single configuration line.
static constexpr unsigned MAX_LINE = 512;

// Keys that must be present in every configuration.
static const char* const REQUIRED_KEYS[] = {
    "listen_addr", "start", "end", "netmask",
    "broadcast", "gateway", "lease_file", "lease_time",
};

// Remove leading and trailing whitespace.
static std::string trim(const std::string& str)
{
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool dhcp::parse_duration(const char* str, u32& secs)
{
    if (!str || !*str) return false;
    u64 total = 0;
    bool first = true;
    while (*str) {
        // Each term is a decimal number...
        u64 value = 0;
        unsigned len = parse_dec(str, UINT32_MAX, value);
        if (!len) return false;
        str += len;
        // ...followed by a unit, unless it is a bare number of seconds.
        u64 scale = 0;
        switch (*str) {
        case 'd':   scale = 86400; break;
        case 'h':   scale = 3600; break;
        case 'm':   scale = 60; break;
        case 's':   scale = 1; break;
        case 0:     scale = first ? 1 : 0; break;
        default:    scale = 0; break;
        }
        if (!scale) return false;
        if (*str) ++str;
        total += value * scale;
        if (total > UINT32_MAX) return false;
        first = false;
    }
    secs = u32(total);
    return true;
}

bool dhcp::parse_bool(const char* str, bool& out)
{
    if (!str) return false;
    if (!strcmp(str, "true") || !strcmp(str, "yes") || !strcmp(str, "1")) {
        out = true; return true;
    }
    if (!strcmp(str, "false") || !strcmp(str, "no") || !strcmp(str, "0")) {
        out = false; return true;
    }
    return false;
}

Config::Config()
    : intf()
    , listen_addr(), start(), end(), netmask(), broadcast(), gateway()
    , dns_servers()
    , lease_static()
    , lease_file()
    , lease_secs(0)
    , strict_server_id(false)
    , log_level(log::INFO)
    , m_keys()
{
    // Nothing else to initialize.
}

bool Config::load(const char* filename)
{
    FileReader rd(filename);
    if (!rd.is_open()) {
        log::Log(log::ERROR, "Config: Cannot open", filename);
        return false;
    }
    return read_from(&rd);
}

bool Config::read_from(Readable* src)
{
    char buff[MAX_LINE];
    unsigned line_num = 0;
    bool ok = true;
    m_keys.clear();

    while (src->read_line(sizeof(buff), buff)) {
        ++line_num;
        // Strip comments and whitespace.
        std::string line(buff);
        size_t cmt = line.find_first_of("#;");
        if (cmt != std::string::npos) line.erase(cmt);
        line = trim(line);
        if (line.empty()) continue;
        // Split into key and value.
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            log::Log(log::ERROR, "Config: Missing '=' on line").write10(line_num);
            ok = false; continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (!parse_pair(key, value)) {
            log::Log(log::ERROR, "Config: Invalid value for", key.c_str())
                .write(" on line").write10(line_num);
            ok = false;
        }
    }
    src->read_finalize();

    return ok && validate();
}

bool Config::parse_pair(const std::string& key, const std::string& value)
{
    m_keys.push_back(key);
    const char* str = value.c_str();

    if (key == "intf") {
        intf = value; return true;
    } else if (key == "listen_addr") {
        return leasecat::ip::parse_addr(str, listen_addr);
    } else if (key == "start") {
        return leasecat::ip::parse_addr(str, start);
    } else if (key == "end") {
        return leasecat::ip::parse_addr(str, end);
    } else if (key == "netmask") {
        Addr tmp;
        if (!leasecat::ip::parse_addr(str, tmp)) return false;
        netmask = tmp;
        return netmask.is_cidr();
    } else if (key == "broadcast") {
        return leasecat::ip::parse_addr(str, broadcast);
    } else if (key == "gateway") {
        return leasecat::ip::parse_addr(str, gateway);
    } else if (key == "dns_servers") {
        // Comma-delimited list, possibly empty.
        dns_servers.clear();
        if (value.empty()) return true;
        size_t pos = 0;
        while (true) {
            size_t next = value.find(',', pos);
            if (next == std::string::npos) next = value.size();
            Addr tmp;
            std::string item = trim(value.substr(pos, next - pos));
            if (!leasecat::ip::parse_addr(item.c_str(), tmp)) return false;
            dns_servers.push_back(tmp);
            if (next == value.size()) break;
            pos = next + 1;
        }
        return dns_servers.size() <= LEASECAT_DHCP_MAX_DNS;
    } else if (key == "lease_static") {
        lease_static = value; return true;
    } else if (key == "lease_file") {
        lease_file = value; return !value.empty();
    } else if (key == "lease_time") {
        return dhcp::parse_duration(str, lease_secs) && lease_secs > 0;
    } else if (key == "strict_server_id") {
        return dhcp::parse_bool(str, strict_server_id);
    } else if (key == "log_level") {
        return log::parse_priority(str, log_level);
    } else {
        log::Log(log::WARNING, "Config: Unknown key", key.c_str());
        return true;
    }
}

bool Config::validate() const
{
    bool ok = true;
    for (const char* key : REQUIRED_KEYS) {
        if (std::find(m_keys.begin(), m_keys.end(), key) == m_keys.end()) {
            log::Log(log::ERROR, "Config: Missing required key", key);
            ok = false;
        }
    }
    if (ok && !(start < end)) {
        log::Log(log::ERROR, "Config: Empty address pool")
            .write(start).write(end);
        ok = false;
    }
    return ok;
}

Params Config::params() const
{
    Params tmp;
    tmp.server      = listen_addr;
    tmp.netmask     = netmask;
    tmp.gateway     = gateway;
    tmp.dns_count   = 0;
    for (auto it = dns_servers.begin() ; it != dns_servers.end() ; ++it) {
        if (tmp.dns_count >= LEASECAT_DHCP_MAX_DNS) break;
        tmp.dns[tmp.dns_count++] = *it;
    }
    tmp.lease_secs  = lease_secs;
    tmp.strict_server_id = strict_server_id;
    return tmp;
}
