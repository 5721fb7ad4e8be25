#include "dns_config.h"

#include <fstream>
#include <stdexcept>
#include <json/json.h>

#include "dns_consts.h"
#include "dns_utils.h"

namespace {

std::string trim(const std::string& str)
{
    const char* spaces = " \t\r\n";
    auto first = str.find_first_not_of(spaces);
    if (first == std::string::npos)
    {
        return std::string();
    }
    auto last = str.find_last_not_of(spaces);
    return str.substr(first, last - first + 1);
}

std::string relative_to(const std::string& base, const std::string& file)
{
    if (file.empty() || file[0] == '/')
    {
        return file;
    }
    auto pos = base.find_last_of('/');
    return pos == std::string::npos ? file : base.substr(0, pos + 1) + file;
}

}

DNSResolverConfig::DNSResolverConfig()
    : port(DNS_PORT)
    , timeout(10)
    , max_hops(32)
    , tcp_fallback(true)
    , verbose(false)
{}

DNSResolverConfig::DNSResolverConfig(const std::string& jsonFile)
    : DNSResolverConfig()
{
    Json::Value root;
    std::ifstream ifs(jsonFile.c_str());
    if (!ifs.is_open())
    {
        throw std::runtime_error("Error opening json file " + jsonFile);
    }
    Json::CharReaderBuilder builder;
    JSONCPP_STRING errs;
    if (!parseFromStream(builder, ifs, &root, &errs))
    {
        throw std::runtime_error("Error parsing json file: " + errs);
    }
    if (!root.isObject())
    {
        throw std::runtime_error("Error parsing json file: top level must be an object");
    }

    port = root.get("port", port).asInt();
    timeout = root.get("timeout", timeout).asInt();
    max_hops = root.get("max_hops", max_hops).asInt();
    tcp_fallback = root.get("tcp_fallback", tcp_fallback).asBool();
    verbose = root.get("verbose", verbose).asBool();

    const Json::Value servers = root["root_servers"];
    for (auto index = 0u; index < servers.size(); ++index)
    {
        root_servers.push_back(servers[index].asString());
    }
    std::string file = root.get("root_servers_file", "").asString();
    if (!file.empty())
    {
        auto list = read_root_servers(relative_to(jsonFile, file));
        root_servers.insert(root_servers.end(), list.begin(), list.end());
    }

    if (root_servers.empty())
    {
        throw std::runtime_error("Error parsing json file: no root servers configured");
    }
    for (const auto& server : root_servers)
    {
        uint8_t addr[4];
        if (!str_to_ipv4(server, addr))
        {
            throw std::runtime_error("Error parsing json file: root server \"" + server + "\" is not an IPv4 address");
        }
    }
    if (port < 1 || port > 65535)
    {
        throw std::runtime_error("Error parsing json file: wrong port");
    }
    if (timeout <= 0 || max_hops <= 0)
    {
        throw std::runtime_error("Error parsing json file: timeout and max_hops must be positive");
    }
}

std::vector<std::string> read_root_servers(const std::string& file)
{
    std::ifstream ifs(file.c_str());
    if (!ifs.is_open())
    {
        throw std::runtime_error("Error opening root servers file " + file);
    }
    std::vector<std::string> result;
    std::string line;
    while (std::getline(ifs, line))
    {
        line = trim(line.substr(0, line.find('#')));
        if (!line.empty())
        {
            result.push_back(line);
        }
    }
    return result;
}
