#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "dns_consts.h"

// One resource record. RDATA stays in the message: names inside it may be
// compressed against earlier parts of the message.
struct DNSRecord
{
public:
    DNSRecord(const std::vector<uint8_t>& msg, size_t& pos);

    DNSRecordType recordType() const { return static_cast<DNSRecordType>(type); }

public:
    std::string name;
    uint16_t type;
    uint16_t cls;
    uint32_t ttl;
    uint16_t len;
    size_t rdata;         // offset of RDATA in the message
};

struct DNSMailExchange
{
    uint16_t preference;
    std::string exchange;
};

struct DNSStartOfAuthority
{
    std::string primary;
    std::string mbox;
    uint32_t serial;
    uint32_t refresh;
    uint32_t retry;
    uint32_t expire;
    uint32_t ttl_min;
};

DNSRecord extract_record(const std::vector<uint8_t>& msg, size_t& pos);

std::string extract_a(const std::vector<uint8_t>& msg, const DNSRecord& rec);
std::string extract_cname(const std::vector<uint8_t>& msg, const DNSRecord& rec);
std::string extract_ns(const std::vector<uint8_t>& msg, const DNSRecord& rec);
DNSMailExchange extract_mx(const std::vector<uint8_t>& msg, const DNSRecord& rec);
DNSStartOfAuthority extract_soa(const std::vector<uint8_t>& msg, const DNSRecord& rec);
