// /*******************************************************************************/
//                                        ChenKe404's font library
// /*******************************************************************************/
//  *  @project	luafnt
//  *  @authors	chenke404
//  *  @file		main.cpp
//  *  @brief 	console front end of the *.fnt to *.lua converter
//
// MIT License
//
// Copyright (c) 2025 chenke404
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//  /******************************************************************************/

#include "converter.h"
#include <iostream>

// 用标准输入代替文件对话框, 输入空行表示取消
struct ConsoleDialog : public lf::FileDialog
{
    bool open(const std::string& filter,const std::string& ext,std::string& out) override
    {
        return ask("Open " + filter + " (*." + ext + "): ",out);
    }

    bool save(const std::string& filter,const std::string& ext,std::string& out) override
    {
        return ask("Save " + filter + " (*." + ext + "): ",out);
    }

private:
    static bool ask(const std::string& prompt,std::string& out)
    {
        std::cout << prompt << std::flush;
        if(!std::getline(std::cin,out))
            return false;
        if(!out.empty() && out.back() == '\r')
            out.pop_back();
        return !out.empty();
    }
};

struct ConsoleSink : public lf::StatusSink
{
    void status(const std::string& message,lf::Severity sv) override
    {
        auto& os = (sv == lf::SV_ERROR || sv == lf::SV_WARNING) ? std::cerr : std::cout;
        os << "[" << lf::severityName(sv) << "] " << message << std::endl;
    }
};

int main()
{
    ConsoleDialog dialog;
    ConsoleSink sink;
    lf::Session session(dialog,sink);

    std::cout << ".fnt to .lua Converter" << std::endl;
    if(session.select())
        std::cout << "Selected: " << session.selected() << std::endl;

    return session.run() ? 0 : 1;
}
