/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	file_io.cpp
@brief 	whole file read/write helpers source

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#include "file_io.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utf8.h>

static inline std::string last_error(const char* fallback)
{
    if(errno != 0)
        return std::strerror(errno);
    return fallback;
}

namespace lf
{

bool readFile(const std::string &filename, std::string &out, std::string *reason)
{
    errno = 0;
    std::ifstream fi(filename,std::ios::binary);
    if(!fi)
    {
        if(reason) *reason = last_error("cannot open file");
        return false;
    }

    std::ostringstream ss;
    errno = 0;
    ss << fi.rdbuf();
    // 空文件时ss会被置failbit, 这不是错误; 目录等无法读取的路径会留下errno
    if(fi.bad() || (ss.tellp() <= 0 && errno != 0))
    {
        if(reason) *reason = last_error("read failed");
        return false;
    }
    out = ss.str();
    return true;
}

bool writeFile(const std::string &filename, const std::string &data, std::string *reason)
{
    errno = 0;
    std::ofstream fo(filename,std::ios::binary | std::ios::trunc);
    if(!fo)
    {
        if(reason) *reason = last_error("cannot create file");
        return false;
    }

    fo.write(data.data(),(std::streamsize)data.size());
    fo.close();
    if(!fo)
    {
        if(reason) *reason = last_error("write failed");
        return false;
    }
    return true;
}

bool validUtf8(const std::string &text, size_t *invalid)
{
    const auto it = utf8::find_invalid(text.begin(),text.end());
    if(it == text.end())
        return true;
    if(invalid) *invalid = (size_t)(it - text.begin());
    return false;
}

bool stripBom(std::string &text)
{
    if(!utf8::starts_with_bom(text.begin(),text.end()))
        return false;
    text.erase(0,3);
    return true;
}

}
