#include "dns_request.h"

#include <memory>
#include <random>

#include "dns_buffer.h"
#include "dns_header.h"
#include "dns_name.h"
#include "dns_utils.h"

DNSIdSource random_id_source()
{
    auto engine = std::make_shared<std::mt19937>(std::random_device{}());
    return [engine]()
    {
        std::uniform_int_distribution<int> dist(1, 0xFFFF);
        return static_cast<uint16_t>(dist(*engine));
    };
}

DNSRequest::DNSRequest(DNSRecordType type, const std::string& name)
    : name(name)
    , type(static_cast<uint16_t>(type))
    , cls(static_cast<uint16_t>(DNSRecordClass::IN))
{}

DNSRequest::DNSRequest(const std::vector<uint8_t>& msg, size_t& pos)
    : name(decode_domain(msg, pos))
    , type(get_uint16(msg, pos))
    , cls(get_uint16(msg, pos))
{}

void DNSRequest::append(DNSBuffer& buf) const
{
    buf.append_domain(name);
    buf.append(type);
    buf.append(cls);
}

std::vector<uint8_t> build_query(uint16_t id, const std::string& qname, bool mx)
{
    DNSHeader header;
    header.ID = id;
    header.QDCOUNT = 1;

    DNSBuffer buf;
    header.append(buf);
    DNSRequest{ mx ? DNSRecordType::MX : DNSRecordType::A, qname }.append(buf);
    return buf.result;
}
