#include "dns_record.h"

#include <algorithm>

#include "dns_errors.h"
#include "dns_name.h"
#include "dns_utils.h"

namespace {

void expect_type(const DNSRecord& rec, DNSRecordType type)
{
    if (rec.recordType() != type)
    {
        throw DNSMalformedMessage("expected " + RecTypeToStr(type) + " record for " + rec.name
            + ", got " + RecTypeToStr(rec.recordType()));
    }
}

// Decodes a name inside RDATA; its sequential part must not run past RDATA.
std::string get_rdata_domain(const std::vector<uint8_t>& msg, const DNSRecord& rec, size_t& pos)
{
    std::string name = decode_domain(msg, pos);
    if (pos > rec.rdata + rec.len)
    {
        throw DNSMalformedMessage("name in " + RecTypeToStr(rec.recordType()) + " record for "
            + rec.name + " overruns RDATA");
    }
    return name;
}

}

DNSRecord::DNSRecord(const std::vector<uint8_t>& msg, size_t& pos)
    : name(decode_domain(msg, pos))
    , type(get_uint16(msg, pos))
    , cls(get_uint16(msg, pos))
    , ttl(get_uint32(msg, pos))
    , len(get_uint16(msg, pos))
    , rdata(pos)
{
    check_available(msg, pos, len);
    pos += len;
}

DNSRecord extract_record(const std::vector<uint8_t>& msg, size_t& pos)
{
    return DNSRecord{ msg, pos };
}

std::string extract_a(const std::vector<uint8_t>& msg, const DNSRecord& rec)
{
    expect_type(rec, DNSRecordType::A);
    uint8_t addr[4];
    if (rec.len != sizeof(addr))
    {
        throw DNSMalformedMessage("A record for " + rec.name + " has " + std::to_string(rec.len)
            + " byte(s) of data");
    }
    check_available(msg, rec.rdata, sizeof(addr));
    std::copy(msg.begin() + rec.rdata, msg.begin() + rec.rdata + sizeof(addr), addr);
    return ipv4_to_str(addr);
}

std::string extract_cname(const std::vector<uint8_t>& msg, const DNSRecord& rec)
{
    expect_type(rec, DNSRecordType::CNAME);
    size_t pos = rec.rdata;
    return get_rdata_domain(msg, rec, pos);
}

std::string extract_ns(const std::vector<uint8_t>& msg, const DNSRecord& rec)
{
    expect_type(rec, DNSRecordType::NS);
    size_t pos = rec.rdata;
    return get_rdata_domain(msg, rec, pos);
}

DNSMailExchange extract_mx(const std::vector<uint8_t>& msg, const DNSRecord& rec)
{
    expect_type(rec, DNSRecordType::MX);
    if (rec.len < sizeof(uint16_t) + 1u)
    {
        throw DNSMalformedMessage("MX record for " + rec.name + " too short");
    }
    size_t pos = rec.rdata;
    DNSMailExchange mx;
    mx.preference = get_uint16(msg, pos);
    mx.exchange = get_rdata_domain(msg, rec, pos);
    return mx;
}

DNSStartOfAuthority extract_soa(const std::vector<uint8_t>& msg, const DNSRecord& rec)
{
    expect_type(rec, DNSRecordType::SOA);
    size_t pos = rec.rdata;
    DNSStartOfAuthority soa;
    soa.primary = get_rdata_domain(msg, rec, pos);
    soa.mbox = get_rdata_domain(msg, rec, pos);
    if (pos + 5 * sizeof(uint32_t) != rec.rdata + rec.len)
    {
        throw DNSMalformedMessage("SOA record for " + rec.name + " has inconsistent length");
    }
    soa.serial = get_uint32(msg, pos);
    soa.refresh = get_uint32(msg, pos);
    soa.retry = get_uint32(msg, pos);
    soa.expire = get_uint32(msg, pos);
    soa.ttl_min = get_uint32(msg, pos);
    return soa;
}
