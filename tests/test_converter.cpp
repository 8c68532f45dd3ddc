/*
*******************************************************************************
    ChenKe404's font library
*******************************************************************************
@project	luafnt
@authors	chenke404
@file	test_converter.cpp
@brief 	end to end conversion tests

// SPDX-License-Identifier: MIT
// Copyright (c) 2025 chenke404
******************************************************************************
*/

#include <gtest/gtest.h>
#include <vector>
#include "converter.h"
#include "file_io.h"

using namespace lf;

static const char* MINIMAL =
    "<font><info size=\"16\"/><chars><char id=\"65\" x=\"0\" y=\"0\" width=\"8\" height=\"16\" "
    "xoffset=\"0\" yoffset=\"0\" xadvance=\"8\"/></chars></font>";

static const char* MINIMAL_LUA =
    "return {\n"
    "    Size = 16,\n"
    "    Characters = {\n"
    "        [\"A\"] = { Vector2.new(8, 16), Vector2.new(0, 0), Vector2.new(0, 0), 8 },\n"
    "    }\n"
    "}\n";

static std::string temp_path(const std::string& name)
{
    return ::testing::TempDir() + "luafnt_" + name;
}

static std::string lua(const std::string& fnt)
{
    const auto ret = convertText(fnt);
    EXPECT_TRUE(ret.ok()) << ret.detail;
    return ret.text;
}

TEST(Convert, Minimal)
{
    EXPECT_EQ(lua(MINIMAL), MINIMAL_LUA);
}

TEST(Convert, Deterministic)
{
    const auto first = convertText(MINIMAL);
    const auto second = convertText(MINIMAL);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.text, second.text);
}

TEST(Convert, CarriageReturnHasEmptyKey)
{
    const auto out = lua("<font><char id=\"13\" xadvance=\"4\"/></font>");
    EXPECT_NE(out.find("        [\"\"] = { Vector2.new(0, 0), Vector2.new(0, 0), Vector2.new(0, 0), 4 },\n"),
              std::string::npos) << out;
}

TEST(Convert, QuoteAndBackslash)
{
    const auto out = lua("<font><char id=\"34\"/><char id=\"92\"/></font>");
    EXPECT_NE(out.find("[\"\\\"\"] = "), std::string::npos) << out;
    EXPECT_NE(out.find("[\"\\\\\"] = "), std::string::npos) << out;
}

TEST(Convert, NegativeOffsets)
{
    const auto out = lua("<font><char id=\"106\" xoffset=\"-2\" yoffset=\"-1\"/></font>");
    EXPECT_NE(out.find("[\"j\"] = { Vector2.new(0, 0), Vector2.new(0, 0), Vector2.new(-2, -1), 0 },"),
              std::string::npos) << out;
}

TEST(Convert, ReversedArrivalOrder)
{
    const auto out = lua("<font><chars><char id=\"66\"/><char id=\"65\"/></chars></font>");
    const auto a = out.find("[\"A\"]");
    const auto b = out.find("[\"B\"]");
    ASSERT_NE(a, std::string::npos);
    ASSERT_NE(b, std::string::npos);
    EXPECT_LT(a, b);
}

TEST(Convert, UnknownAttributesIgnored)
{
    const auto out = lua("<font><char id=\"65\" width=\"8\" height=\"16\" chnl=\"15\" page=\"0\"/></font>");
    EXPECT_NE(out.find("[\"A\"] = { Vector2.new(8, 16), Vector2.new(0, 0), Vector2.new(0, 0), 0 },"),
              std::string::npos) << out;
    EXPECT_EQ(out.find("15"), std::string::npos);
    EXPECT_EQ(lua("<font><info size=\"16\"/><chars><char id=\"65\" x=\"0\" y=\"0\" width=\"8\" height=\"16\" "
                  "xoffset=\"0\" yoffset=\"0\" xadvance=\"8\" page=\"0\" chnl=\"15\" letter=\"A\"/></chars></font>"),
              MINIMAL_LUA);
}

TEST(Convert, UnknownElementsIgnored)
{
    const auto out = lua(
        "<?xml version=\"1.0\"?>\n"
        "<!-- BMFont -->\n"
        "<font>\n"
        "  <info face=\"Arial\" size=\"16\" bold=\"0\"/>\n"
        "  <common lineHeight=\"16\" base=\"13\" scaleW=\"64\" scaleH=\"64\" pages=\"1\"/>\n"
        "  <pages><page id=\"0\" file=\"a.png\"/></pages>\n"
        "  <chars count=\"1\">\n"
        "    <char id=\"65\" x=\"0\" y=\"0\" width=\"8\" height=\"16\" xoffset=\"0\" yoffset=\"0\" xadvance=\"8\"/>\n"
        "  </chars>\n"
        "  <kernings count=\"1\"><kerning first=\"65\" second=\"65\" amount=\"-1\"/></kernings>\n"
        "</font>\n");
    EXPECT_EQ(out, MINIMAL_LUA);
}

TEST(Convert, MissingInfoGivesZeroSize)
{
    const auto out = lua("<font><chars/></font>");
    EXPECT_NE(out.find("    Size = 0,\n"), std::string::npos) << out;
}

TEST(Convert, OnlyIdGivesZeros)
{
    const auto out = lua("<font><char id=\"65\"/></font>");
    EXPECT_NE(out.find("[\"A\"] = { Vector2.new(0, 0), Vector2.new(0, 0), Vector2.new(0, 0), 0 },"),
              std::string::npos) << out;
}

TEST(Convert, DuplicateCodeLastWins)
{
    const auto out = lua("<font><char id=\"65\" xadvance=\"3\"/><char id=\"65\" xadvance=\"9\"/></font>");
    EXPECT_NE(out.find(", 9 },"), std::string::npos) << out;
    EXPECT_EQ(out.find(", 3 },"), std::string::npos) << out;
}

TEST(Convert, KeyEscapesEndToEnd)
{
    const auto out = lua(
        "<font><chars>"
        "<char id=\"128512\"/><char id=\"10\"/><char id=\"0\"/><char id=\"65\"/>"
        "</chars></font>");
    EXPECT_NE(out.find("[\"\\u{A}\"] = "), std::string::npos) << out;
    EXPECT_NE(out.find("[\"\"] = "), std::string::npos) << out;
    EXPECT_NE(out.find("[\"\xF0\x9F\x98\x80\"] = "), std::string::npos) << out;
}

TEST(Convert, TextFormatMatchesXml)
{
    const auto text = lua(
        "info face=\"Arial\" size=16 bold=0\n"
        "common lineHeight=16 base=13 scaleW=64 scaleH=64 pages=1\n"
        "page id=0 file=\"a.png\"\n"
        "chars count=1\n"
        "char id=65 x=0 y=0 width=8 height=16 xoffset=0 yoffset=0 xadvance=8 page=0 chnl=15\n");
    EXPECT_EQ(text, MINIMAL_LUA);
}

TEST(Convert, ByteOrderMarkIsSkipped)
{
    EXPECT_EQ(lua(std::string("\xEF\xBB\xBF") + MINIMAL), MINIMAL_LUA);
}

TEST(Convert, Errors)
{
    auto ret = convertText("<font><char id=\"65\" xadvance=\"abc\"/></font>");
    EXPECT_EQ(ret.error, ConvertResult::ERR_VALUE);
    EXPECT_TRUE(ret.text.empty());

    ret = convertText("<font><char id=\"65\"></font>");
    EXPECT_EQ(ret.error, ConvertResult::ERR_SYNTAX);
    EXPECT_FALSE(ret.detail.empty());

    ret = convertText(std::string("<font><info size=\"1\"/>\xC3(</font>"));
    EXPECT_EQ(ret.error, ConvertResult::ERR_ENCODING);
    EXPECT_NE(ret.detail.find("byte 22"), std::string::npos) << ret.detail;
}

TEST(Convert, FromFile)
{
    const auto path = temp_path("minimal.fnt");
    ASSERT_TRUE(writeFile(path, MINIMAL));
    const auto ret = convert(path);
    ASSERT_TRUE(ret.ok()) << ret.detail;
    EXPECT_EQ(ret.text, MINIMAL_LUA);
}

TEST(Convert, MissingFile)
{
    const auto ret = convert(temp_path("does_not_exist.fnt"));
    EXPECT_EQ(ret.error, ConvertResult::ERR_READ);
    EXPECT_FALSE(ret.detail.empty());
}

TEST(FileIo, WriteAndRead)
{
    const auto path = temp_path("roundtrip.txt");
    std::string reason;
    ASSERT_TRUE(writeFile(path, "first", &reason)) << reason;
    ASSERT_TRUE(writeFile(path, "second", &reason)) << reason;
    std::string data;
    ASSERT_TRUE(readFile(path, data, &reason)) << reason;
    EXPECT_EQ(data, "second");
}

TEST(FileIo, WriteIntoMissingDirectory)
{
    std::string reason;
    EXPECT_FALSE(writeFile(temp_path("no/such/dir/out.lua"), "x", &reason));
    EXPECT_FALSE(reason.empty());
}

TEST(FileIo, Utf8)
{
    size_t bad = 0;
    EXPECT_TRUE(validUtf8("plain \xE4\xB8\xAD"));
    EXPECT_FALSE(validUtf8("ab\xFF", &bad));
    EXPECT_EQ(bad, 2u);

    std::string s = "\xEF\xBB\xBFx";
    EXPECT_TRUE(stripBom(s));
    EXPECT_EQ(s, "x");
    EXPECT_FALSE(stripBom(s));
}

////////////////////////////////////////////////////////////////////////////////////////////////////
/// Session
struct FakeDialog : public FileDialog
{
    std::string openPath;
    std::string savePath;
    std::vector<std::string> requests;

    bool open(const std::string& filter,const std::string& ext,std::string& out) override
    {
        requests.push_back(filter + "|" + ext);
        out = openPath;
        return !out.empty();
    }

    bool save(const std::string& filter,const std::string& ext,std::string& out) override
    {
        requests.push_back(filter + "|" + ext);
        out = savePath;
        return !out.empty();
    }
};

struct FakeSink : public StatusSink
{
    std::vector<std::pair<std::string,Severity>> messages;
    int cleared = 0;

    void status(const std::string& message,Severity sv) override
    {
        messages.emplace_back(message,sv);
    }

    void clear() override
    {
        ++cleared;
    }
};

TEST(Session, RequiresSelection)
{
    FakeDialog dialog;
    FakeSink sink;
    Session session(dialog, sink);
    EXPECT_FALSE(session.run());
    EXPECT_EQ(session.message(), "Please select a .fnt file first");
    EXPECT_EQ(session.severity(), SV_WARNING);
    ASSERT_EQ(sink.messages.size(), 1u);
    EXPECT_TRUE(dialog.requests.empty());
}

TEST(Session, SelectCancelled)
{
    FakeDialog dialog;
    FakeSink sink;
    Session session(dialog, sink);
    EXPECT_FALSE(session.select());
    EXPECT_TRUE(session.selected().empty());
    ASSERT_EQ(dialog.requests.size(), 1u);
    EXPECT_EQ(dialog.requests[0], "FNT files|fnt");
}

TEST(Session, ConvertsAndSaves)
{
    FakeDialog dialog;
    dialog.openPath = temp_path("session_in.fnt");
    dialog.savePath = temp_path("session_out.lua");
    ASSERT_TRUE(writeFile(dialog.openPath, MINIMAL));

    FakeSink sink;
    Session session(dialog, sink);
    ASSERT_TRUE(session.select());
    EXPECT_EQ(session.selected(), dialog.openPath);
    EXPECT_EQ(sink.cleared, 1);

    ASSERT_TRUE(session.run());
    EXPECT_EQ(session.severity(), SV_SUCCESS);
    EXPECT_EQ(session.message(), "Saved to " + dialog.savePath);
    EXPECT_EQ(dialog.requests.back(), "Lua files|lua");

    std::string saved;
    ASSERT_TRUE(readFile(dialog.savePath, saved));
    EXPECT_EQ(saved, MINIMAL_LUA);
}

TEST(Session, ParseErrorIsReported)
{
    FakeDialog dialog;
    dialog.savePath = temp_path("never_written.lua");
    FakeSink sink;
    Session session(dialog, sink);
    session.setSelected(temp_path("missing_input.fnt"));

    EXPECT_FALSE(session.run());
    EXPECT_EQ(session.message(), "Error parsing file!");
    EXPECT_EQ(session.severity(), SV_ERROR);
    // 解析失败时不会弹出保存对话框
    EXPECT_TRUE(dialog.requests.empty());
}

TEST(Session, SaveCancelledKeepsStatus)
{
    FakeDialog dialog;
    dialog.openPath = temp_path("cancel_in.fnt");
    ASSERT_TRUE(writeFile(dialog.openPath, MINIMAL));
    FakeSink sink;
    Session session(dialog, sink);
    ASSERT_TRUE(session.select());

    EXPECT_FALSE(session.run());
    EXPECT_FALSE(session.hasStatus());
    EXPECT_TRUE(sink.messages.empty());
}

TEST(Session, SaveErrorIsReported)
{
    FakeDialog dialog;
    dialog.openPath = temp_path("save_err_in.fnt");
    dialog.savePath = temp_path("no/such/dir/out.lua");
    ASSERT_TRUE(writeFile(dialog.openPath, MINIMAL));
    FakeSink sink;
    Session session(dialog, sink);
    ASSERT_TRUE(session.select());

    EXPECT_FALSE(session.run());
    EXPECT_EQ(session.severity(), SV_ERROR);
    EXPECT_EQ(session.message().rfind("Error saving file: ", 0), 0u) << session.message();
    EXPECT_GT(session.message().size(), std::string("Error saving file: ").size());
}

TEST(Session, SelectingClearsStatus)
{
    FakeDialog dialog;
    dialog.openPath = temp_path("clear_in.fnt");
    FakeSink sink;
    Session session(dialog, sink);
    session.run();
    ASSERT_TRUE(session.hasStatus());

    ASSERT_TRUE(session.select());
    EXPECT_FALSE(session.hasStatus());
    EXPECT_EQ(session.severity(), SV_INFO);
}

TEST(Session, SeverityNames)
{
    EXPECT_STREQ(severityName(SV_SUCCESS), "success");
    EXPECT_STREQ(severityName(SV_ERROR), "error");
    EXPECT_STREQ(severityName(SV_WARNING), "warning");
    EXPECT_STREQ(severityName(SV_INFO), "info");
}
