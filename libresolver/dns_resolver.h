#pragma once

#include <string>
#include <vector>

#include "dns_config.h"
#include "dns_request.h"

class IDNSTransport;
class ILogger;
class DNSPackage;

enum class DNSOutcome
{
    Resolved,
    TldInvalid,           // name error one hop below the root
    DomainInvalid,        // name error at the second level
    SubdomainUnresolved,  // name error further down
    Unresolved,           // every root server attempt failed
};

struct DNSResolution
{
    DNSOutcome outcome;
    std::string value;    // address if resolved, failure reason if unresolved
    std::string root;     // root server of the attempt that decided the outcome
};

struct DNSResolutionFrame
{
    std::string server;
    std::string name;
    bool mx;
    std::string root;
    int depth;
};

class DNSResolver
{
public:
    DNSResolver(const DNSResolverConfig& config,
                IDNSTransport* transport,
                ILogger* logger = nullptr,
                DNSIdSource ids = random_id_source());

    // Tries the configured root servers in order. Throws DNSInvalidName for a
    // malformed host; failures of single attempts only show up in the
    // Unresolved reason.
    DNSResolution resolve(const std::string& host, bool mx);

    // One attempt starting at the given root server. Throws DNSError on
    // transport, codec, referral and hop limit failures.
    DNSResolution resolveFrom(const std::string& root, const std::string& host, bool mx);

private:
    DNSPackage query(const DNSResolutionFrame& frame, int& hops);
    DNSPackage exchange(const DNSResolutionFrame& frame, const std::vector<uint8_t>& request,
                        uint16_t id, DNSProtocol protocol);

    DNSResolverConfig config;
    IDNSTransport* transport;
    ILogger* logger;
    DNSIdSource ids;
};
