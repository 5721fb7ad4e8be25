#include "dns_buffer.h"

#include "dns_name.h"
#include "dns_utils.h"

DNSBuffer::DNSBuffer()
{
    result.reserve(512);
}

void DNSBuffer::append_domain(const std::string& str)
{
    auto encoded = encode_domain(str);
    result.insert(result.end(), encoded.begin(), encoded.end());
}

void DNSBuffer::append(uint16_t val)
{
    ::append_uint16(result, val);
}

void DNSBuffer::append(uint32_t val)
{
    ::append_uint32(result, val);
}

void DNSBuffer::append(const uint8_t* ptr, size_t size)
{
    result.insert(result.end(), ptr, ptr + size);
}

void DNSBuffer::overwrite_uint16(size_t pos, uint16_t val)
{
    result[pos] = static_cast<uint8_t>(val >> 8);
    result[pos + 1] = static_cast<uint8_t>(val & 0xFF);
}
