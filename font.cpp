/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	font.cpp
@brief 	glyph metrics table source

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#include "font.h"

namespace lf
{

using Char = Font::Char;
using CharMap = Font::CharMap;

////////////////////////////////////////////////////////////////////////////////////////////////////
/// Font
Font::Font()
    : _size(0)
{}

int Font::size() const
{
    return _size;
}

void Font::setSize(int size)
{
    _size = size;
}

const CharMap &Font::chrs() const
{
    return _chrs;
}

void Font::insert(const Char &ch)
{
    _chrs[ch.code] = ch;
}

void Font::clear()
{
    _size = 0;
    _chrs.clear();
}

bool Font::load(const Adapter &adp)
{
    clear();
    setSize(adp.size());
    for(auto& it : adp.charMap())
    {
        insert(it.second);
    }
    return valid();
}

bool Font::valid() const
{
    return !_chrs.empty();
}


////////////////////////////////////////////////////////////////////////////////////////////////////
/// Adapter
int Font::Adapter::size() const
{
    return _size;
}

const CharMap &Font::Adapter::charMap() const
{
    return _chrs;
}

}
