#pragma once
#include <string>
#include <cstdint>

namespace haul {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::string format_mib(uint64_t bytes);
std::string read_text_file(const std::string& path);

} // namespace haul
