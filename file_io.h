/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	file_io.h
@brief 	whole file read/write helpers header

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#ifndef LF_FILE_IO_H
#define LF_FILE_IO_H

#include <cstddef>
#include <string>

namespace lf
{

// 读取整个文件, 失败时reason为系统错误描述
bool readFile(const std::string& filename,std::string& out,std::string* reason = nullptr);

// 写入整个文件, 已存在时覆盖
bool writeFile(const std::string& filename,const std::string& data,std::string* reason = nullptr);

// 是否是合法的UTF-8, 不合法时invalid为第一个非法字节的位置
bool validUtf8(const std::string& text,size_t* invalid = nullptr);

// 去掉开头的UTF-8 BOM, 返回是否去掉了
bool stripBom(std::string& text);

}

#endif // LF_FILE_IO_H
