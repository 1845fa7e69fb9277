/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <rapidjson/document.h>

#include <cstdint>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendora::json
{

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
};

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions = {});

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

[[nodiscard]] inline rapidjson::Value makeString(
    std::string_view str, rapidjson::Document::AllocatorType& allocator)
{
    return rapidjson::Value{
        str.data(), static_cast<rapidjson::SizeType>(str.size()), allocator};
}

//-------------------------------------------------------------------------

}  // namespace lendora::json

//-------------------------------------------------------------------------
