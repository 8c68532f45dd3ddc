/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	converter.cpp
@brief 	*.fnt to *.lua conversion source

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#include "converter.h"
#include "file_io.h"
#include "fnt_adapter.h"
#include <iostream>

static inline void log_error(const std::string& text)
{ std::cerr << "Converter [ERROR] -> " << text << std::endl; }

static inline void warning(const std::string& text)
{ std::cerr << "Converter [WARN] -> " << text << std::endl; }

namespace lf
{

ConvertResult convert(const std::string &filename, const LuaWriter::Options &opts)
{
    ConvertResult ret;
    std::string content;
    std::string reason;
    if(!readFile(filename,content,&reason))
    {
        log_error("failed to read " + filename + ": " + reason);
        ret.error = ConvertResult::ERR_READ;
        ret.detail = reason;
        return ret;
    }
    return convertText(std::move(content),opts);
}

ConvertResult convertText(std::string content, const LuaWriter::Options &opts)
{
    ConvertResult ret;
    size_t bad = 0;
    if(!validUtf8(content,&bad))
    {
        ret.error = ConvertResult::ERR_ENCODING;
        ret.detail = "invalid UTF-8 at byte " + std::to_string(bad);
        log_error(ret.detail);
        return ret;
    }
    stripBom(content);

    FntAdapter adp;
    if(!adp.load(content))
    {
        ret.error = adp.error() == FntAdapter::ERR_VALUE ?
                    ConvertResult::ERR_VALUE : ConvertResult::ERR_SYNTAX;
        ret.detail = adp.message();
        return ret;
    }

    // 没有字符时仍然输出空表
    Font fnt;
    if(!fnt.load(adp))
        warning("no characters found, writing an empty table");
    ret.text = LuaWriter(opts).format(fnt);
    return ret;
}

const char *severityName(Severity sv)
{
    switch(sv)
    {
    case SV_SUCCESS: return "success";
    case SV_ERROR: return "error";
    case SV_WARNING: return "warning";
    case SV_INFO: return "info";
    }
    return "info";
}

////////////////////////////////////////////////////////////////////////////////////////////////////
/// Session
Session::Session(FileDialog &dialog, StatusSink &sink)
    : _dialog(dialog),
    _sink(sink),
    _severity(SV_INFO)
{}

bool Session::select()
{
    std::string filename;
    if(!_dialog.open("FNT files","fnt",filename))
        return false;
    setSelected(filename);
    return true;
}

void Session::setSelected(const std::string &filename)
{
    _selected = filename;
    reset();
}

const std::string &Session::selected() const
{
    return _selected;
}

bool Session::run()
{
    if(_selected.empty())
    {
        report("Please select a .fnt file first",SV_WARNING);
        return false;
    }

    const auto ret = convert(_selected);
    if(!ret.ok())
    {
        report("Error parsing file!",SV_ERROR);
        return false;
    }

    // 取消保存时不改变状态
    std::string output;
    if(!_dialog.save("Lua files","lua",output))
        return false;

    std::string reason;
    if(!writeFile(output,ret.text,&reason))
    {
        report("Error saving file: " + reason,SV_ERROR);
        return false;
    }
    report("Saved to " + output,SV_SUCCESS);
    return true;
}

bool Session::hasStatus() const
{
    return !_message.empty();
}

const std::string &Session::message() const
{
    return _message;
}

Severity Session::severity() const
{
    return _severity;
}

void Session::report(const std::string &message, Severity sv)
{
    _message = message;
    _severity = sv;
    _sink.status(message,sv);
}

void Session::reset()
{
    _message.clear();
    _severity = SV_INFO;
    _sink.clear();
}

}
