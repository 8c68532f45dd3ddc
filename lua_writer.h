/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	lua_writer.h
@brief 	lua table writer header

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#ifndef LF_LUA_WRITER_H
#define LF_LUA_WRITER_H

#include "font.h"

namespace lf
{

// 把字体输出为lua表:
// return {
//     Size = 16,
//     Characters = {
//         ["A"] = { Vector2.new(w, h), Vector2.new(x, y), Vector2.new(ox, oy), xadvance },
//     }
// }
struct LuaWriter
{
    struct Options
    {
        int indent = 4;                     // 每级缩进的空格数
        std::string vector = "Vector2.new"; // 运行时提供的二维向量构造函数
    };

    LuaWriter();
    explicit LuaWriter(const Options& opts);

    const Options& options() const;

    // 生成完整的lua文本
    std::string format(const Font& fnt) const;
    std::string format(int size,const Font::CharMap& chrs) const;

    // 字符在表中的键(不含两侧引号)
    // 0和13输出为空串, 控制字符和非法码点输出为 \u{HEX}
    static std::string key(char32_t code);

private:
    Options _opts;
};

}

#endif // LF_LUA_WRITER_H
