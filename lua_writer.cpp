/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	lua_writer.cpp
@brief 	lua table writer source

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#include "lua_writer.h"
#include <iostream>
#include <iterator>
#include <locale>
#include <sstream>
#include <utf8.h>

static inline void warning(const char* text)
{ std::cerr << "LuaWriter [WARN] -> " << text << std::endl; }

// Unicode Cc类别
static inline bool is_control(char32_t c)
{ return c < 0x20 || (c >= 0x7F && c <= 0x9F); }

static inline bool is_scalar(char32_t c)
{ return c <= 0x10FFFF && !(c >= 0xD800 && c <= 0xDFFF); }

static inline std::string hex_escape(char32_t c)
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << "\\u{" << std::hex << std::uppercase << (uint32_t)c << "}";
    return ss.str();
}

namespace lf
{

LuaWriter::LuaWriter()
{}

LuaWriter::LuaWriter(const Options &opts)
    : _opts(opts)
{}

const LuaWriter::Options &LuaWriter::options() const
{
    return _opts;
}

std::string LuaWriter::format(const Font &fnt) const
{
    return format(fnt.size(),fnt.chrs());
}

std::string LuaWriter::format(int size, const Font::CharMap &chrs) const
{
    // 0和13都输出为空键, 载入时后者会覆盖前者
    if(chrs.count(0) && chrs.count(13))
        warning("characters 0 and 13 share the empty key, only the last one survives in lua!");

    const std::string sp(_opts.indent < 0 ? 0 : _opts.indent,' ');
    const auto& vec = _opts.vector;

    std::ostringstream ss;
    ss.imbue(std::locale::classic());   // 数字不带千分位
    ss << "return {\n"
       << sp << "Size = " << size << ",\n"
       << sp << "Characters = {\n";
    for(auto& it : chrs)
    {
        const auto& c = it.second;
        ss << sp << sp << "[\"" << key(it.first) << "\"] = { "
           << vec << "(" << c.width << ", " << c.height << "), "
           << vec << "(" << c.x << ", " << c.y << "), "
           << vec << "(" << c.xoffset << ", " << c.yoffset << "), "
           << c.xadvance << " },\n";
    }
    ss << sp << "}\n"
       << "}\n";
    return ss.str();
}

std::string LuaWriter::key(char32_t code)
{
    if(code == 0 || code == 13)
        return {};
    if(code == '"')
        return "\\\"";
    if(code == '\\')
        return "\\\\";
    if(is_control(code) || !is_scalar(code))
        return hex_escape(code);

    std::string out;
    utf8::append(uint32_t(code),std::back_inserter(out));
    return out;
}

}
