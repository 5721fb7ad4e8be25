#include "dns_utils.h"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>

#include "dns_errors.h"

void check_available(const std::vector<uint8_t>& msg, size_t pos, size_t len)
{
    if (pos > msg.size() || len > msg.size() - pos)
    {
        throw DNSMalformedMessage("need " + std::to_string(len) + " byte(s) at offset "
            + std::to_string(pos) + ", message has " + std::to_string(msg.size()));
    }
}

uint8_t get_uint8(const std::vector<uint8_t>& msg, size_t& pos)
{
    check_available(msg, pos, sizeof(uint8_t));
    uint8_t val = msg[pos];
    pos += sizeof(uint8_t);
    return val;
}

uint16_t get_uint16(const std::vector<uint8_t>& msg, size_t& pos)
{
    check_available(msg, pos, sizeof(uint16_t));
    uint16_t val = static_cast<uint16_t>((msg[pos] << 8) | msg[pos + 1]);
    pos += sizeof(uint16_t);
    return val;
}

uint32_t get_uint32(const std::vector<uint8_t>& msg, size_t& pos)
{
    check_available(msg, pos, sizeof(uint32_t));
    uint32_t val = (static_cast<uint32_t>(msg[pos]) << 24)
                 | (static_cast<uint32_t>(msg[pos + 1]) << 16)
                 | (static_cast<uint32_t>(msg[pos + 2]) << 8)
                 | static_cast<uint32_t>(msg[pos + 3]);
    pos += sizeof(uint32_t);
    return val;
}

void append_uint16(std::vector<uint8_t>& buf, uint16_t val)
{
    val = htons(val);
    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(&val);
    buf.insert(buf.end(), ptr, ptr + sizeof(val));
}

void append_uint32(std::vector<uint8_t>& buf, uint32_t val)
{
    val = htonl(val);
    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(&val);
    buf.insert(buf.end(), ptr, ptr + sizeof(val));
}

bool same_domain(const std::string& a, const std::string& b)
{
    auto strip = [](const std::string& str)
    {
        return !str.empty() && str.back() == '.' ? str.substr(0, str.size() - 1) : str;
    };
    std::string lhs = strip(a);
    std::string rhs = strip(b);
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(),
        [](char x, char y)
        {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
}

std::string RecTypeToStr(DNSRecordType type)
{
    switch (type)
    {
    case DNSRecordType::A:
        return "A";
    case DNSRecordType::NS:
        return "NS";
    case DNSRecordType::CNAME:
        return "CNAME";
    case DNSRecordType::SOA:
        return "SOA";
    case DNSRecordType::MX:
        return "MX";
    default:
        return "TYPE" + std::to_string(static_cast<uint16_t>(type));
    }
}

std::string ResultCodeToStr(DNSResultCode code)
{
    switch (code)
    {
    case DNSResultCode::NoError:
        return "NOERROR";
    case DNSResultCode::FormatError:
        return "FORMERR";
    case DNSResultCode::ServerFailure:
        return "SERVFAIL";
    case DNSResultCode::NameError:
        return "NXDOMAIN";
    case DNSResultCode::NotImplemented:
        return "NOTIMP";
    case DNSResultCode::Refused:
        return "REFUSED";
    default:
        return "RCODE" + std::to_string(static_cast<int>(code));
    }
}

bool str_to_ipv4(const std::string& val, uint8_t out[4])
{
    return 1 == inet_pton(AF_INET, val.c_str(), out);
}

std::string ipv4_to_str(uint8_t const addr[4])
{
    char buf[INET_ADDRSTRLEN] = { 0 };
    inet_ntop(AF_INET, addr, buf, INET_ADDRSTRLEN);
    return std::string(buf);
}
