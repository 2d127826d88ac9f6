#pragma once

#include "RasterExtractor.hpp"

#include <QString>
#include <cstdint>
#include <tuple>

struct Config
{
    struct colors
    {
        uint32_t selection{0x3daee9FF};
        uint32_t overlay{0x00000066};
        uint32_t background{0x00000000};
    } colors{};

    struct window
    {
        bool menubar{true};
        QString title_format{"%1 - pagecrop"};
        std::tuple<int, int> initial_size{-1,
                                          -1}; // width, height; -1 for default
    } window{};

    struct zoom
    {
        double min{0.5};
        double max{3.0};
        double step{0.25};
        double initial{1.0};
    } zoom{};

    struct rendering
    {
        float dpi{72.0f};
        int antialiasing_bits{8};
    } rendering{};

    struct exporting
    {
        int jpeg_quality{90};
        QString file_name{"pdf-cropped-selection"};
        RasterExtractor::Format default_format{
            RasterExtractor::Format::LosslessRGBA};
    } exporting{};

    struct behavior
    {
        bool start_in_crop_mode{false};
        int startpage_override{-1};
    } behavior{};
};
