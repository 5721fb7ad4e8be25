#pragma once

#include <string>
#include <vector>

#include "dns_consts.h"

// One query/response round trip with a single server. Implementations throw
// DNSTransportTimeout when no reply arrives in time and DNSTransportError on
// any other transport failure.
class IDNSTransport
{
public:
    virtual ~IDNSTransport() {}

    virtual std::vector<uint8_t> exchange(const std::string& server,
                                          const std::vector<uint8_t>& query,
                                          int timeout,
                                          DNSProtocol protocol) = 0;
};
