#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace posix_term
{

    // First bytes of a chunk as hex for log lines, e.g. "48 65 6c ... (+27)"
    inline std::string hex_head(const uint8_t *p, size_t n, size_t max_bytes = 16)
    {
        std::string out;
        char cell[4];
        size_t m = std::min(n, max_bytes);
        for (size_t i = 0; i < m; ++i)
        {
            std::snprintf(cell, sizeof(cell), i ? " %02x" : "%02x", p[i]);
            out += cell;
        }
        if (n > m)
            out += " ... (+" + std::to_string(n - m) + ")";
        return out;
    }

} // namespace posix_term
