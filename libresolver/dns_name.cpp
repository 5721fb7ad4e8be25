#include "dns_name.h"

#include "dns_consts.h"
#include "dns_errors.h"
#include "dns_utils.h"

std::vector<uint8_t> encode_domain(const std::string& name)
{
    std::string str{ name };
    if (!str.empty() && str.back() == '.')
    {
        str.pop_back();
    }

    std::vector<uint8_t> result;
    size_t start = 0;
    while (!str.empty())
    {
        auto pos = str.find('.', start);
        auto label = str.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (label.empty())
        {
            throw DNSInvalidName("empty label in \"" + name + "\"");
        }
        if (label.size() > DNS_MAX_LABEL)
        {
            throw DNSInvalidName("label \"" + label + "\" longer than 63 bytes");
        }
        result.push_back(static_cast<uint8_t>(label.size()));
        result.insert(result.end(), label.begin(), label.end());
        if (pos == std::string::npos)
        {
            break;
        }
        start = pos + 1;
    }
    result.push_back('\0');

    if (result.size() > DNS_MAX_NAME)
    {
        throw DNSInvalidName("\"" + name + "\" longer than 255 bytes on the wire");
    }
    return result;
}

std::string decode_domain(const std::vector<uint8_t>& msg, size_t& pos)
{
    std::string result;
    size_t curr = pos;
    size_t next = 0;
    size_t wire_size = 1;
    int pointers = 0;
    bool compressed = false;
    for (;;)
    {
        auto len = get_uint8(msg, curr);
        auto type = len >> 6;
        if (0 == len)
        {
            break;
        }
        else if (0 == type)
        {
            check_available(msg, curr, len);
            wire_size += static_cast<size_t>(len) + 1u;
            if (wire_size > DNS_MAX_NAME)
            {
                throw DNSMalformedMessage("name at offset " + std::to_string(pos) + " longer than 255 bytes");
            }
            if (!result.empty())
            {
                result.append(".");
            }
            result.append(reinterpret_cast<const char*>(&msg[curr]), len);
            curr += len;
        }
        else if (3 == type)
        {
            size_t start = curr - 1;
            size_t target = (static_cast<size_t>(len & 0x3F) << 8) + get_uint8(msg, curr);
            if (target >= start)
            {
                throw DNSMalformedMessage("compression pointer at offset " + std::to_string(start)
                    + " does not point backwards");
            }
            if (++pointers > DNS_MAX_POINTERS)
            {
                throw DNSMalformedMessage("too many compression pointers");
            }
            if (!compressed)
            {
                next = curr;
                compressed = true;
            }
            curr = target;
        }
        else
        {
            throw DNSMalformedMessage("unsupported label type at offset " + std::to_string(curr - 1));
        }
    }
    pos = compressed ? next : curr;
    return result;
}
