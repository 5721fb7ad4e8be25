#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "dns_consts.h"

// Readers advance pos and throw DNSMalformedMessage past the end of msg.
uint8_t get_uint8(const std::vector<uint8_t>& msg, size_t& pos);
uint16_t get_uint16(const std::vector<uint8_t>& msg, size_t& pos);
uint32_t get_uint32(const std::vector<uint8_t>& msg, size_t& pos);
void check_available(const std::vector<uint8_t>& msg, size_t pos, size_t len);

void append_uint16(std::vector<uint8_t>& buf, uint16_t val);
void append_uint32(std::vector<uint8_t>& buf, uint32_t val);

// Case-insensitive, ignoring one trailing dot on either side.
bool same_domain(const std::string& a, const std::string& b);

std::string RecTypeToStr(DNSRecordType type);
std::string ResultCodeToStr(DNSResultCode code);

bool str_to_ipv4(const std::string& val, uint8_t out[4]);
std::string ipv4_to_str(uint8_t const addr[4]);
