#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "dns_header.h"
#include "dns_request.h"
#include "dns_record.h"

// End of the question section: the end of the first QNAME plus QTYPE/QCLASS.
size_t question_end(const std::vector<uint8_t>& msg);

// Targets of the NS records among the first nsCount authority records.
// Skips the question and answer sections first.
std::vector<std::string> extract_ns_list(const std::vector<uint8_t>& msg, uint16_t nsCount);

class DNSPackage
{
public:
    DNSPackage(const std::vector<uint8_t>& msg);

    const DNSRecord* firstAnswer(DNSRecordType type) const;
    const DNSRecord* firstAuthority(DNSRecordType type) const;
    std::vector<std::string> nameservers() const;
    std::string glue(const std::string& host) const;

public:
    std::vector<uint8_t> message;
    DNSHeader header;
    std::vector<DNSRequest> requests;
    std::vector<DNSRecord> answers;
    std::vector<DNSRecord> authorities;
    std::vector<DNSRecord> additionals;
};
