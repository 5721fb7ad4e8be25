#pragma once

#include <string>
#include <vector>

#include "dns_consts.h"
#include "dns_transport.h"

struct sockaddr_in;

// Talks to servers given as IPv4 literals; never falls back to the system
// resolver for host names.
class DNSClient : public IDNSTransport
{
public:
    DNSClient(int port = DNS_PORT);

    std::vector<uint8_t> exchange(const std::string& server,
                                  const std::vector<uint8_t>& query,
                                  int timeout,
                                  DNSProtocol protocol) override;

    std::vector<uint8_t> requestUdp(const std::string& server, const std::vector<uint8_t>& query, int timeout);
    std::vector<uint8_t> requestTcp(const std::string& server, const std::vector<uint8_t>& query, int timeout);

private:
    void address(const std::string& server, sockaddr_in& addr) const;

    int port;
};
