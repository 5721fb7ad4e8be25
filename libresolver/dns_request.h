#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "dns_consts.h"

class DNSBuffer;

// Source of transaction IDs for outgoing queries.
typedef std::function<uint16_t()> DNSIdSource;

DNSIdSource random_id_source();

class DNSRequest
{
public:
    DNSRequest(DNSRecordType type, const std::string& name);
    DNSRequest(const std::vector<uint8_t>& msg, size_t& pos);

    void append(DNSBuffer& buf) const;

public:
    std::string name;
    uint16_t type;
    uint16_t cls;
};

// Iterative query: RD clear, one question of type MX or A, class IN.
std::vector<uint8_t> build_query(uint16_t id, const std::string& qname, bool mx);
