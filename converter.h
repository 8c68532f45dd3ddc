/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	converter.h
@brief 	*.fnt to *.lua conversion header

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#ifndef LF_CONVERTER_H
#define LF_CONVERTER_H

#include <string>
#include "lua_writer.h"

namespace lf
{

struct ConvertResult
{
    enum Error {
        ERR_NONE,
        ERR_READ,       // 文件无法读取
        ERR_ENCODING,   // 不是UTF-8
        ERR_SYNTAX,     // 文档格式错误
        ERR_VALUE       // 属性值不是整数
    };

    Error error = ERR_NONE;
    std::string text;   // 成功时为lua文本
    std::string detail; // 失败原因

    inline bool ok() const { return error == ERR_NONE; }
};

// 读取*.fnt文件并转换为lua文本, 除读取文件外没有副作用
ConvertResult convert(const std::string& filename,const LuaWriter::Options& opts = {});

// 从内存转换
ConvertResult convertText(std::string content,const LuaWriter::Options& opts = {});

enum Severity {
    SV_SUCCESS,
    SV_ERROR,
    SV_WARNING,
    SV_INFO
};

const char* severityName(Severity sv);

// 文件选择对话框, 取消时返回false
struct FileDialog
{
    virtual ~FileDialog() = default;
    // @filter: 过滤器名称, 如"FNT files"
    // @ext: 扩展名, 不带点
    virtual bool open(const std::string& filter,const std::string& ext,std::string& out) = 0;
    virtual bool save(const std::string& filter,const std::string& ext,std::string& out) = 0;
};

// 状态显示
struct StatusSink
{
    virtual ~StatusSink() = default;
    virtual void status(const std::string& message,Severity sv) = 0;
    // 清除当前显示的状态
    virtual void clear() {}
};

// 一次转换会话: 选择文件 -> 转换 -> 保存
class Session
{
public:
    Session(FileDialog& dialog,StatusSink& sink);

    // 选择*.fnt文件, 选中后清除状态
    bool select();
    // 手动设置输入文件
    void setSelected(const std::string& filename);
    const std::string& selected() const;

    // 转换并保存, 全部成功时返回true
    bool run();

    bool hasStatus() const;
    const std::string& message() const;
    Severity severity() const;

private:
    void report(const std::string& message,Severity sv);
    void reset();

    FileDialog& _dialog;
    StatusSink& _sink;
    std::string _selected;
    std::string _message;
    Severity _severity;
};

}

#endif // LF_CONVERTER_H
