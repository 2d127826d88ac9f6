#pragma once

#include <QColor>
#include <QString>
#include <cstdint>
#include <string_view>

bool
parseHexColor(std::string_view s, uint32_t &out);

static inline QColor
rgbaToQColor(uint32_t rgba) noexcept
{
    return QColor((rgba >> 24) & 0xFF, (rgba >> 16) & 0xFF, (rgba >> 8) & 0xFF,
                  rgba & 0xFF);
}

QString
formatFileSize(qint64 bytes) noexcept;
