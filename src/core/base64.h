#pragma once
#include <string>

std::string base64Encode(const std::string& input);
std::string base64Decode(const std::string& input);

// RFC 4648 section 5 alphabet, padding stripped (VirusTotal URL identifiers)
std::string base64UrlEncode(const std::string& input);
