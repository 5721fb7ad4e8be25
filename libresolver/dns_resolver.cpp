#include "dns_resolver.h"

#include <ostream>

#include "dns_errors.h"
#include "dns_logger.h"
#include "dns_name.h"
#include "dns_package.h"
#include "dns_transport.h"
#include "dns_utils.h"

namespace {

DNSOutcome name_error_outcome(int depth)
{
    if (depth == 0)
    {
        return DNSOutcome::TldInvalid;
    }
    if (depth == 1)
    {
        return DNSOutcome::DomainInvalid;
    }
    return DNSOutcome::SubdomainUnresolved;
}

bool is_name_error(const DNSPackage& response)
{
    return response.firstAuthority(DNSRecordType::SOA) != nullptr
        || static_cast<DNSResultCode>(response.header.flags.RCODE) == DNSResultCode::NameError;
}

// The SOA only feeds the log; a broken one must not change the outcome.
std::string describe_soa(const DNSPackage& response)
{
    const DNSRecord* soa = response.firstAuthority(DNSRecordType::SOA);
    if (!soa)
    {
        return "no SOA";
    }
    try
    {
        return "zone " + soa->name + ", primary " + extract_soa(response.message, *soa).primary;
    }
    catch (const DNSMalformedMessage& e)
    {
        return "unparsable SOA for zone " + soa->name + ": " + e.what();
    }
}

DNSMailExchange preferred_exchange(const DNSPackage& response)
{
    bool found = false;
    DNSMailExchange best{ 0, std::string() };
    for (const auto& rec : response.answers)
    {
        if (rec.recordType() != DNSRecordType::MX)
        {
            continue;
        }
        DNSMailExchange mx = extract_mx(response.message, rec);
        if (!found || mx.preference < best.preference)
        {
            best = mx;
            found = true;
        }
    }
    if (!found)
    {
        throw DNSMalformedMessage("authoritative answer carries no MX record");
    }
    return best;
}

DNSResolutionFrame restart(const DNSResolutionFrame& frame, const std::string& name, bool mx)
{
    return DNSResolutionFrame{ frame.root, name, mx, frame.root, frame.depth + 1 };
}

}

DNSResolver::DNSResolver(const DNSResolverConfig& config,
                         IDNSTransport* transport,
                         ILogger* logger,
                         DNSIdSource ids)
    : config(config)
    , transport(transport)
    , logger(logger)
    , ids(ids)
{}

DNSResolution DNSResolver::resolve(const std::string& host, bool mx)
{
    encode_domain(host);

    std::string reason = "no root servers configured";
    for (const auto& root : config.root_servers)
    {
        try
        {
            return resolveFrom(root, host, mx);
        }
        catch (const DNSError& e)
        {
            if (logger)
            {
                logger->log() << "Hostname could not be resolved using " << root << ": " << e.what() << std::endl;
            }
            reason = e.what();
        }
    }
    return DNSResolution{ DNSOutcome::Unresolved, reason, std::string() };
}

DNSResolution DNSResolver::resolveFrom(const std::string& root, const std::string& host, bool mx)
{
    // Frames suspended until the address of their next nameserver is known.
    std::vector<DNSResolutionFrame> pending;
    DNSResolutionFrame frame{ root, host, mx, root, 0 };
    int hops = 0;

    for (;;)
    {
        DNSPackage response = query(frame, hops);

        if (is_name_error(response))
        {
            if (!pending.empty())
            {
                throw DNSUnresolvedReferral("nameserver " + frame.name + " does not exist");
            }
            DNSResolution result{ name_error_outcome(frame.depth), std::string(), root };
            if (logger)
            {
                logger->log() << "Name error for " << frame.name << " at depth " << frame.depth
                              << " (" << describe_soa(response) << ")" << std::endl;
            }
            return result;
        }

        auto rcode = static_cast<DNSResultCode>(response.header.flags.RCODE);
        if (rcode != DNSResultCode::NoError)
        {
            throw DNSServerFailure(frame.server, ResultCodeToStr(rcode));
        }

        if (const DNSRecord* cname = response.firstAnswer(DNSRecordType::CNAME))
        {
            std::string target = extract_cname(response.message, *cname);
            if (logger)
            {
                logger->log() << frame.name << " is an alias for " << target << std::endl;
            }
            frame = restart(frame, target, frame.mx);
            continue;
        }

        if (response.header.flags.AA)
        {
            if (frame.mx)
            {
                DNSMailExchange exchange = preferred_exchange(response);
                if (logger)
                {
                    logger->log() << "Mail for " << frame.name << " is handled by " << exchange.exchange
                                  << " (preference " << exchange.preference << ")" << std::endl;
                }
                frame = restart(frame, exchange.exchange, false);
                continue;
            }

            const DNSRecord* a = response.firstAnswer(DNSRecordType::A);
            if (a == nullptr)
            {
                throw DNSMalformedMessage("authoritative answer for " + frame.name + " carries no A record");
            }
            std::string address = extract_a(response.message, *a);
            if (pending.empty())
            {
                return DNSResolution{ DNSOutcome::Resolved, address, root };
            }

            DNSResolutionFrame parent = pending.back();
            pending.pop_back();
            parent.server = address;
            parent.depth += 1;
            frame = parent;
            continue;
        }

        std::vector<std::string> nameservers = response.nameservers();
        if (nameservers.empty())
        {
            throw DNSUnresolvedReferral(frame.server + " returned no nameservers for " + frame.name);
        }
        const std::string& next = nameservers.front();
        std::string glue = response.glue(next);
        if (logger)
        {
            logger->log() << "Referral to " << next << (glue.empty() ? std::string() : " (" + glue + ")") << std::endl;
        }
        if (!glue.empty())
        {
            frame.server = glue;
            frame.depth += 1;
            continue;
        }

        for (const auto& waiting : pending)
        {
            if (same_domain(waiting.name, next))
            {
                throw DNSUnresolvedReferral("nameserver " + next + " depends on itself");
            }
        }
        pending.push_back(frame);
        frame = restart(frame, next, false);
    }
}

DNSPackage DNSResolver::query(const DNSResolutionFrame& frame, int& hops)
{
    if (++hops > config.max_hops)
    {
        throw DNSMaxHopsExceeded(config.max_hops);
    }

    uint16_t id = ids();
    std::vector<uint8_t> request = build_query(id, frame.name, frame.mx);
    if (logger)
    {
        logger->log() << "Querying " << frame.server << " for " << frame.name
                      << " (" << (frame.mx ? "MX" : "A") << ", depth " << frame.depth << ")" << std::endl;
    }

    DNSPackage response = exchange(frame, request, id, DNSProtocol::UDP);
    if (!response.header.flags.TC)
    {
        return response;
    }
    if (!config.tcp_fallback)
    {
        throw DNSTruncatedResponse(frame.server);
    }
    if (logger)
    {
        logger->log() << "Truncated response from " << frame.server << ", retrying over TCP" << std::endl;
    }
    response = exchange(frame, request, id, DNSProtocol::TCP);
    if (response.header.flags.TC)
    {
        throw DNSTruncatedResponse(frame.server);
    }
    return response;
}

DNSPackage DNSResolver::exchange(const DNSResolutionFrame& frame, const std::vector<uint8_t>& request,
                                 uint16_t id, DNSProtocol protocol)
{
    DNSPackage response(transport->exchange(frame.server, request, config.timeout, protocol));
    if (response.header.ID != id)
    {
        throw DNSMalformedMessage("response ID " + std::to_string(response.header.ID)
            + " does not match query ID " + std::to_string(id));
    }
    if (!response.header.flags.QR)
    {
        throw DNSMalformedMessage("reply from " + frame.server + " is not a response");
    }
    if (response.requests.size() != 1 || !same_domain(response.requests[0].name, frame.name))
    {
        throw DNSMalformedMessage("reply from " + frame.server + " answers a different question");
    }
    return response;
}
