#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Dotted name -> wire form: length-prefixed labels and a terminating zero
// label. A single trailing dot is accepted; "" and "." encode the root.
// Throws DNSInvalidName on empty or oversized labels and names over 255 bytes.
std::vector<uint8_t> encode_domain(const std::string& name);

// Reads the name starting at pos and leaves pos right after it in the
// sequential layout, i.e. after the first compression pointer if the name
// uses one. Pointers must point strictly backwards. Throws DNSMalformedMessage
// and leaves pos untouched.
std::string decode_domain(const std::vector<uint8_t>& msg, size_t& pos);
