#include "dns_package.h"

#include "dns_consts.h"
#include "dns_name.h"
#include "dns_utils.h"

namespace {

const DNSRecord* find_record(const std::vector<DNSRecord>& records, DNSRecordType type)
{
    for (const auto& rec : records)
    {
        if (rec.recordType() == type)
        {
            return &rec;
        }
    }
    return nullptr;
}

void skip_question(const std::vector<uint8_t>& msg, size_t& pos)
{
    decode_domain(msg, pos);
    check_available(msg, pos, 2 * sizeof(uint16_t));
    pos += 2 * sizeof(uint16_t);
}

}

size_t question_end(const std::vector<uint8_t>& msg)
{
    size_t pos = DNS_HEADER_SIZE;
    skip_question(msg, pos);
    return pos;
}

std::vector<std::string> extract_ns_list(const std::vector<uint8_t>& msg, uint16_t nsCount)
{
    size_t pos = 0;
    DNSHeader header(msg, pos);
    for (auto i = 0; i < header.QDCOUNT; ++i)
    {
        skip_question(msg, pos);
    }
    for (auto i = 0; i < header.ANCOUNT; ++i)
    {
        extract_record(msg, pos);
    }
    std::vector<std::string> result;
    for (auto i = 0; i < nsCount; ++i)
    {
        DNSRecord rec = extract_record(msg, pos);
        if (rec.recordType() == DNSRecordType::NS)
        {
            result.push_back(extract_ns(msg, rec));
        }
    }
    return result;
}

DNSPackage::DNSPackage(const std::vector<uint8_t>& msg)
    : message(msg)
{
    size_t pos = 0;
    header = DNSHeader(message, pos);
    for (auto i = 0; i < header.QDCOUNT; ++i)
    {
        requests.emplace_back(DNSRequest{ message, pos });
    }
    for (auto i = 0; i < header.ANCOUNT; ++i)
    {
        answers.emplace_back(extract_record(message, pos));
    }
    for (auto i = 0; i < header.NSCOUNT; ++i)
    {
        authorities.emplace_back(extract_record(message, pos));
    }
    for (auto i = 0; i < header.ARCOUNT; ++i)
    {
        additionals.emplace_back(extract_record(message, pos));
    }
}

const DNSRecord* DNSPackage::firstAnswer(DNSRecordType type) const
{
    return find_record(answers, type);
}

const DNSRecord* DNSPackage::firstAuthority(DNSRecordType type) const
{
    return find_record(authorities, type);
}

std::vector<std::string> DNSPackage::nameservers() const
{
    return extract_ns_list(message, header.NSCOUNT);
}

std::string DNSPackage::glue(const std::string& host) const
{
    for (const auto& rec : additionals)
    {
        if (rec.recordType() == DNSRecordType::A && same_domain(rec.name, host))
        {
            return extract_a(message, rec);
        }
    }
    return std::string();
}
