#pragma once

#include <stdexcept>
#include <string>

// Failures local to one root server attempt. The resolver catches DNSError
// and moves on to the next root; anything else propagates.
class DNSError : public std::runtime_error
{
public:
    explicit DNSError(const std::string& what)
        : std::runtime_error(what)
    {}
};

class DNSInvalidName : public DNSError
{
public:
    explicit DNSInvalidName(const std::string& what)
        : DNSError("invalid domain name: " + what)
    {}
};

class DNSMalformedMessage : public DNSError
{
public:
    explicit DNSMalformedMessage(const std::string& what)
        : DNSError("malformed DNS message: " + what)
    {}
};

class DNSTruncatedResponse : public DNSMalformedMessage
{
public:
    explicit DNSTruncatedResponse(const std::string& server)
        : DNSMalformedMessage("truncated response from " + server)
    {}
};

class DNSTransportError : public DNSError
{
public:
    explicit DNSTransportError(const std::string& what)
        : DNSError(what)
    {}
};

class DNSTransportTimeout : public DNSTransportError
{
public:
    explicit DNSTransportTimeout(const std::string& server)
        : DNSTransportError("timeout waiting for " + server)
    {}
};

class DNSServerFailure : public DNSError
{
public:
    DNSServerFailure(const std::string& server, const std::string& rcode)
        : DNSError(server + " answered " + rcode)
    {}
};

class DNSUnresolvedReferral : public DNSError
{
public:
    explicit DNSUnresolvedReferral(const std::string& what)
        : DNSError("unresolved referral: " + what)
    {}
};

class DNSMaxHopsExceeded : public DNSError
{
public:
    explicit DNSMaxHopsExceeded(int hops)
        : DNSError("gave up after " + std::to_string(hops) + " queries")
    {}
};
