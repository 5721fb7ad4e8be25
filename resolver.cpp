#include <iostream>
#include <string>

#include "dns_client.h"
#include "dns_config.h"
#include "dns_logger.h"
#include "dns_resolver.h"

class LoggerImpl: public ILogger
{
public:
    std::ostream& log() override
    {
        return std::cerr;
    }
};

static int usage()
{
    std::cerr << "usage: dns_resolver [-v] [-m] <hostname> [config.json]" << std::endl;
    std::cerr << "  -m  resolve the mail exchange instead of the address" << std::endl;
    std::cerr << "  -v  log every query to stderr" << std::endl;
    return 1;
}

int main(int argc, char* argv[])
{
    bool mx = false;
    bool verbose = false;
    std::string host;
    std::string configFile = "resolver.json";

    int index = 1;
    for (; index < argc && argv[index][0] == '-'; ++index)
    {
        std::string option = argv[index];
        if (option == "-m")
        {
            mx = true;
        }
        else if (option == "-v")
        {
            verbose = true;
        }
        else
        {
            return usage();
        }
    }
    if (index >= argc || argc - index > 2)
    {
        return usage();
    }
    host = argv[index++];
    if (index < argc)
    {
        configFile = argv[index];
    }

    try
    {
        DNSResolverConfig config(configFile);
        LoggerImpl logger;
        DNSClient client(config.port);
        DNSResolver resolver(config, &client, verbose || config.verbose ? &logger : nullptr);

        DNSResolution result = resolver.resolve(host, mx);
        switch (result.outcome)
        {
        case DNSOutcome::Resolved:
            if (mx)
            {
                std::cout << "The mail exchange for " << host << " resolves to: " << result.value << std::endl;
            }
            else
            {
                std::cout << "The name " << host << " resolves to: " << result.value << std::endl;
            }
            return 0;
        case DNSOutcome::TldInvalid:
            std::cout << "Invalid TLD" << std::endl;
            break;
        case DNSOutcome::DomainInvalid:
            std::cout << "Invalid domain" << std::endl;
            break;
        case DNSOutcome::SubdomainUnresolved:
            std::cout << "Subdomain could not be resolved" << std::endl;
            break;
        case DNSOutcome::Unresolved:
            std::cout << "Hostname could not be resolved: " << result.value << std::endl;
            break;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Critical error: " << e.what() << std::endl;
    }

    return 1;
}
