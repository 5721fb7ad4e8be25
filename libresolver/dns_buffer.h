#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class DNSBuffer
{
public:
    DNSBuffer();

    void append_domain(const std::string& str);
    void append(const uint16_t val);
    void append(const uint32_t val);
    void append(const uint8_t* ptr, size_t size);

    void overwrite_uint16(size_t pos, uint16_t val);
public:
    std::vector<uint8_t> result;
};
