/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	fnt_adapter.cpp
@brief 	BMFont *.fnt load adapter class source

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#include "fnt_adapter.h"
#include <cstring>
#include <iostream>
#include <limits>
#include <sstream>
#include <expat.h>

using Attribute = lf::FntAdapter::Attribute;
using Attributes = lf::FntAdapter::Attributes;

static inline void warning(const std::string& text)
{ std::cerr << "Font [WARN] -> Fnt adapter " << text << std::endl; }

static inline bool is_blank(char c)
{ return c == ' ' || c == '\t'; }

template<typename T>
static bool parse_decimal(const std::string& s,T& out)
{
    using limits = std::numeric_limits<T>;
    if(s.empty()) return false;

    size_t i = 0;
    bool neg = false;
    if(s[0] == '+' || s[0] == '-')
    {
        neg = s[0] == '-';
        ++i;
    }
    if(i == s.size()) return false;
    if(neg && !limits::is_signed) return false;

    // 负数的绝对值上限比正数大1
    const uint64_t limit = neg ? uint64_t(limits::max()) + 1 : uint64_t(limits::max());
    uint64_t v = 0;
    for(; i < s.size(); ++i)
    {
        const char c = s[i];
        if(c < '0' || c > '9')
            return false;
        v = v * 10 + (c - '0');
        if(v > limit)
            return false;
    }
    out = neg ? T(-int64_t(v)) : T(v);
    return true;
}

// 文本格式的一行: tag key=value key="value with space" ...
// 只有引号未闭合时返回false
static bool split_line(const std::string& line,std::string& tag,Attributes& attrs)
{
    tag.clear();
    attrs.clear();

    size_t pos = 0;
    auto skip = [&](){ for(; pos < line.size() && is_blank(line[pos]); ++pos); };

    skip();
    const auto left = pos;
    for(; pos < line.size() && !is_blank(line[pos]); ++pos);
    tag = line.substr(left,pos-left);

    for(;;)
    {
        skip();
        if(pos >= line.size())
            return true;

        Attribute attr;
        const auto kl = pos;
        for(; pos < line.size() && !is_blank(line[pos]) && line[pos] != '='; ++pos);
        attr.name = line.substr(kl,pos-kl);
        // name和=之间允许空格
        skip();
        if(pos >= line.size() || line[pos] != '=')
            continue;   // 没有值的记号, 忽略
        ++pos;
        skip();

        if(pos < line.size() && line[pos] == '"')
        {
            const auto vl = ++pos;
            pos = line.find('"',vl);
            if(pos == line.npos)
                return false;
            attr.value = line.substr(vl,pos-vl);
            ++pos;
        }
        else
        {
            const auto vl = pos;
            for(; pos < line.size() && !is_blank(line[pos]); ++pos);
            attr.value = line.substr(vl,pos-vl);
        }
        attrs.push_back(attr);
    }
}

namespace lf
{

bool parseInt(const std::string &s, int32_t &out)
{
    return parse_decimal(s,out);
}

bool parseUint(const std::string &s, uint32_t &out)
{
    return parse_decimal(s,out);
}

bool FntAdapter::load(const std::string &text)
{
    _size = 0;
    _chrs.clear();
    _error = ERR_NONE;
    _message.clear();

    const auto pos = text.find_first_not_of(" \t\r\n");
    if(pos != text.npos && text[pos] == '<')
        return loadXml(text);
    return loadText(text);
}

FntAdapter::Error FntAdapter::error() const
{
    return _error;
}

const std::string &FntAdapter::message() const
{
    return _message;
}

// expat回调的上下文
struct FntAdapter::XmlContext
{
    FntAdapter* adp;
    XML_Parser parser;
    bool stopped = false;   // 属性值错误时主动停止

    // <char .../> 和 <char ...></char> 都只触发一次开始回调
    static void XMLCALL onStart(void* user,const XML_Char* name,const XML_Char** atts)
    {
        auto ctx = static_cast<XmlContext*>(user);
        const bool info = strcmp(name,"info") == 0;
        if(!info && strcmp(name,"char") != 0)
            return;

        Attributes attrs;
        for(int i = 0; atts[i]; i += 2)
            attrs.push_back({ atts[i], atts[i+1] });

        const bool ok = info ? ctx->adp->readInfo(attrs) : ctx->adp->readChar(attrs);
        if(!ok)
        {
            ctx->stopped = true;
            XML_StopParser(ctx->parser,XML_FALSE);
        }
    }
};

bool FntAdapter::loadXml(const std::string &text)
{
    // 内容已经校验过是UTF-8
    XmlContext ctx { this, XML_ParserCreate("UTF-8") };
    if(!ctx.parser)
        return fail(ERR_SYNTAX,"failed to create xml parser");
    XML_SetUserData(ctx.parser,&ctx);
    XML_SetStartElementHandler(ctx.parser,&XmlContext::onStart);

    const auto status = XML_Parse(ctx.parser,text.data(),(int)text.size(),XML_TRUE);
    std::ostringstream ss;
    if(status == XML_STATUS_ERROR && !ctx.stopped)
    {
        // expat的列号从0开始
        ss << "xml error at " << XML_GetCurrentLineNumber(ctx.parser) << ":"
           << XML_GetCurrentColumnNumber(ctx.parser) + 1 << ": "
           << XML_ErrorString(XML_GetErrorCode(ctx.parser));
    }
    XML_ParserFree(ctx.parser);

    if(ctx.stopped)
        return false;   // 错误已由readInfo/readChar记录
    if(status == XML_STATUS_ERROR)
        return fail(ERR_SYNTAX,ss.str());
    return true;
}

bool FntAdapter::loadText(const std::string &text)
{
    std::istringstream si(text);
    std::string line, tag;
    Attributes attrs;
    int num = 0;
    while (std::getline(si, line))
    {
        ++num;
        if(!line.empty() && line.back() == '\r')
            line.pop_back();
        if(!split_line(line,tag,attrs))
            return fail(ERR_SYNTAX,"unterminated quote at line " + std::to_string(num));

        if(tag == "info")
        {
            if(!readInfo(attrs))
                return false;
        }
        else if(tag == "char")
        {
            if(!readChar(attrs))
                return false;
        }
    }
    return true;
}

bool FntAdapter::readInfo(const Attributes &attrs)
{
    for(auto& it : attrs)
    {
        if(it.name != "size")
            continue;
        int32_t v = 0;
        if(!parseInt(it.value,v))
            return fail(ERR_VALUE,"invalid value of info.size: \"" + it.value + "\"");
        _size = v;
    }
    return true;
}

bool FntAdapter::readChar(const Attributes &attrs)
{
    Font::Char c;
    auto vint = [this](const Attribute& a,int& out){
        int32_t v = 0;
        if(!parseInt(a.value,v))
            return fail(ERR_VALUE,"invalid value of char." + a.name + ": \"" + a.value + "\"");
        out = v;
        return true;
    };

    bool ok = true;
    for(auto& it : attrs)
    {
        if(it.name == "id")
        {
            uint32_t code = 0;
            if(!parseUint(it.value,code))
                return fail(ERR_VALUE,"invalid value of char.id: \"" + it.value + "\"");
            c.code = code;
        }
        else if(it.name == "x") ok = vint(it,c.x);
        else if(it.name == "y") ok = vint(it,c.y);
        else if(it.name == "width") ok = vint(it,c.width);
        else if(it.name == "height") ok = vint(it,c.height);
        else if(it.name == "xoffset") ok = vint(it,c.xoffset);
        else if(it.name == "yoffset") ok = vint(it,c.yoffset);
        else if(it.name == "xadvance") ok = vint(it,c.xadvance);
        if(!ok)
            return false;
    }
    // 后出现的同码字符覆盖先前的
    _chrs[c.code] = c;
    return true;
}

bool FntAdapter::fail(Error err, const std::string &msg)
{
    _error = err;
    _message = msg;
    warning(msg);
    return false;
}

}
