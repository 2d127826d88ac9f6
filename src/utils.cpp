#include "utils.hpp"

#include <cctype>

namespace
{

int
hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

} // namespace

// Accepts "#RRGGBB" and "#RRGGBBAA" (leading '#' optional). RGB-only colors
// get full alpha.
bool
parseHexColor(std::string_view s, uint32_t &out)
{
    if (!s.empty() && s.front() == '#')
        s.remove_prefix(1);

    if (s.size() != 6 && s.size() != 8)
        return false;

    uint32_t value = 0;
    for (char c : s)
    {
        const int v = hexValue(c);
        if (v < 0)
            return false;
        value = (value << 4) | static_cast<uint32_t>(v);
    }

    if (s.size() == 6)
        value = (value << 8) | 0xFF;

    out = value;
    return true;
}

QString
formatFileSize(qint64 bytes) noexcept
{
    if (bytes < 1024)
        return QString("%1 B").arg(bytes);
    if (bytes < 1024 * 1024)
        return QString("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
    return QString("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
}
