#include "dns_header.h"
#include "dns_consts.h"
#include "dns_utils.h"
#include "dns_buffer.h"

DNSHeaderFlags::DNSHeaderFlags()
    : RCODE(0)
    , Z(0)
    , RA(0)
    , RD(0)
    , TC(0)
    , AA(0)
    , Opcode(0)
    , QR(0)
{}

DNSHeaderFlags::DNSHeaderFlags(const std::vector<uint8_t>& msg, size_t& pos)
{
    uint16_t val = get_uint16(msg, pos);
    QR = (val >> 15) & 0x1;
    Opcode = (val >> 11) & 0xF;
    AA = (val >> 10) & 0x1;
    TC = (val >> 9) & 0x1;
    RD = (val >> 8) & 0x1;
    RA = (val >> 7) & 0x1;
    Z = (val >> 4) & 0x7;
    RCODE = val & 0xF;
}

uint16_t DNSHeaderFlags::value() const
{
    return static_cast<uint16_t>((QR << 15) | (Opcode << 11) | (AA << 10) | (TC << 9)
        | (RD << 8) | (RA << 7) | (Z << 4) | RCODE);
}

void DNSHeaderFlags::append(DNSBuffer& buf) const
{
    buf.append(value());
}

DNSHeader::DNSHeader()
    : ID(0)
    , QDCOUNT(0)
    , ANCOUNT(0)
    , NSCOUNT(0)
    , ARCOUNT(0)
{}

DNSHeader::DNSHeader(const std::vector<uint8_t>& msg)
{
    size_t pos = 0;
    *this = DNSHeader(msg, pos);
}

DNSHeader::DNSHeader(const std::vector<uint8_t>& msg, size_t& pos)
{
    check_available(msg, pos, DNS_HEADER_SIZE);
    ID = get_uint16(msg, pos);
    flags = DNSHeaderFlags(msg, pos);
    QDCOUNT = get_uint16(msg, pos);
    ANCOUNT = get_uint16(msg, pos);
    NSCOUNT = get_uint16(msg, pos);
    ARCOUNT = get_uint16(msg, pos);
}

void DNSHeader::append(DNSBuffer& buf) const
{
    buf.append(ID);
    flags.append(buf);
    buf.append(QDCOUNT);
    buf.append(ANCOUNT);
    buf.append(NSCOUNT);
    buf.append(ARCOUNT);
}
