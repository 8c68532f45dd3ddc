/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	fnt_adapter.h
@brief 	BMFont *.fnt load adapter class header

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#ifndef LF_FNT_ADAPTER_H
#define LF_FNT_ADAPTER_H

#include "font.h"
#include <vector>

namespace lf
{

// BMFont, 支持xml和文本两种描述格式
struct FntAdapter : public Font::Adapter
{
    enum Error {
        ERR_NONE,
        ERR_SYNTAX,     // 文档格式错误
        ERR_VALUE       // 属性值不是合法整数
    };
    struct Attribute
    {
        std::string name;
        std::string value;
    };
    using Attributes = std::vector<Attribute>;

    // 从内存读取, 格式根据第一个非空白字符判断('<'为xml)
    // 失败时已经读取的字符仍然保留
    bool load(const std::string& text);

    Error error() const;
    const std::string& message() const;

private:
    struct XmlContext;
    bool loadXml(const std::string& text);
    bool loadText(const std::string& text);
    bool readInfo(const Attributes& attrs);
    bool readChar(const Attributes& attrs);
    bool fail(Error err,const std::string& msg);

    Error _error = ERR_NONE;
    std::string _message;
};

// 解析十进制整数, 允许前导+/-, 不允许空白和多余字符
bool parseInt(const std::string& s,int32_t& out);
bool parseUint(const std::string& s,uint32_t& out);

}

#endif // LF_FNT_ADAPTER_H
