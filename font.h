/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	font.h
@brief 	glyph metrics table header

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#ifndef LF_FONT_H
#define LF_FONT_H

#include <cstdint>
#include <string>
#include <map>

namespace lf
{

struct Font
{
    // 字符信息
    struct Char
    {
        char32_t code = 0;      //字符的unicode码
        int x = 0;              //字符在纹理中的左上角x
        int y = 0;              //字符在纹理中的左上角y
        int width = 0;          //字符宽度
        int height = 0;         //字符高度
        int xoffset = 0;        //字符水平偏移
        int yoffset = 0;        //字符垂直偏移
        int xadvance = 0;       //绘制后笔的水平前进量
    };
    // 按字符码升序排列, 保证输出顺序稳定
    using CharMap = std::map<char32_t,Char>;

    // 字体适配器, 用于从其他格式读取字体
    struct Adapter
    {
        int size() const;
        const CharMap& charMap() const;
    protected:
        int _size = 0;
        CharMap _chrs;
    };

    Font();

    // 字体的标称大小
    int size() const;
    void setSize(int size);

    // 返回字符表
    const CharMap& chrs() const;

    // 插入字符, 相同字符码的旧字符会被替换
    void insert(const Char& ch);
    // 清除所有字符
    void clear();

    // 从适配器读取字体
    bool load(const Adapter&);
    // 是否含有字符
    bool valid() const;
private:
    int _size;
    CharMap _chrs;
};

}

#endif // LF_FONT_H
