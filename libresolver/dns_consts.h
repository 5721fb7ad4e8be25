#pragma once

#include <cstdint>

enum class DNSRecordType : uint16_t
{
    OTHER = 0,
    A = 1,
    NS = 2,
    CNAME = 5,
    SOA = 6,
    MX = 15,
};

enum class DNSRecordClass : uint16_t
{
    IN = 1,
};

enum class DNSResultCode
{
    NoError = 0,
    FormatError = 1,
    ServerFailure = 2,
    NameError = 3,
    NotImplemented = 4,
    Refused = 5
};

enum class DNSProtocol
{
    UDP,
    TCP,
};

#define DNS_PORT 53
#define DNS_HEADER_SIZE 12
#define DNS_MAX_LABEL 63
#define DNS_MAX_NAME 255
#define DNS_MAX_POINTERS 128
#define UDP_SIZE 4096
