#pragma once

#include <cstdint>
#include <string>
#include <optional>

namespace env
{
    std::optional<std::string> get_string(const char* name);
    std::optional<bool> get_bool(const char* name);
    std::optional<uint16_t> get_int(const char* name);
    std::optional<uint64_t> get_ulong(const char* name);

    std::string get_string(const char* name, std::string def);
    bool get_bool(const char* name, bool def);
    uint16_t get_int(const char* name, uint16_t def);
}
