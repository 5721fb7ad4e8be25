#pragma once

#include <string>
#include <vector>

struct DNSResolverConfig
{
public:
    DNSResolverConfig();
    DNSResolverConfig(const std::string& jsonFile);

public:
    std::vector<std::string> root_servers;  // fallback order
    int port;
    int timeout;                            // seconds, per query
    int max_hops;                           // queries per root server attempt
    bool tcp_fallback;                      // retry truncated replies over TCP
    bool verbose;
};

// One address per line; blank lines and '#' comments are skipped.
std::vector<std::string> read_root_servers(const std::string& file);
