#include "anchorpatch/core/indentation.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace anchorpatch {

TEST(IndentationTest, RecognisesPythonSources)
{
    auto empty = create_document({});
    EXPECT_TRUE(is_python_source("tool.py", empty));
    EXPECT_TRUE(is_python_source("/src/App.PYW", empty));
    EXPECT_FALSE(is_python_source("main.cpp", empty));

    auto script = create_document({"#!/usr/bin/env Python3", "print('hi')"});
    EXPECT_TRUE(is_python_source("bin/tool", script));
    EXPECT_FALSE(is_python_source("bin/tool", create_document({"#!/bin/sh"})));
}

TEST(IndentationTest, ConsistentSpacesNeedNoFix)
{
    auto document = create_document({"def f():", "    if x:", "        return 1", "", "    return 2"});

    auto analysis = analyze_indentation(document);

    EXPECT_FALSE(analysis.needs_fix());
    EXPECT_TRUE(analysis.has_spaces);
    EXPECT_FALSE(analysis.has_tabs);
    EXPECT_EQ(analysis.total_lines, 5);
    EXPECT_EQ(analysis.indented_lines, 4);
}

TEST(IndentationTest, DetectsTabsAndSpacesAcrossLines)
{
    auto document = create_document({"def f():", "\tif x:", "        return 1"});

    auto analysis = analyze_indentation(document);

    EXPECT_TRUE(analysis.has_tabs);
    EXPECT_TRUE(analysis.has_spaces);
    EXPECT_TRUE(analysis.mixed_lines.empty());
    EXPECT_TRUE(analysis.needs_fix());
}

TEST(IndentationTest, DetectsMixedLineAndInconsistentWidth)
{
    auto document = create_document({"def f():", "    a = 1", "\t  b = 2", "      c = 3"});

    auto analysis = analyze_indentation(document);

    EXPECT_EQ(analysis.mixed_lines, (std::vector<size_t>{3}));
    EXPECT_EQ(analysis.inconsistent_widths, (std::vector<size_t>{6}));
    EXPECT_THAT(describe_analysis(analysis), ::testing::HasSubstr("1 line(s) mix tabs and spaces"));
}

TEST(IndentationTest, NormalisesToSpaces)
{
    auto document = create_document({"def f():", "\treturn 1", "  \tx", "   ", "\t\ty"});

    auto fixed = normalize_indentation(document, IndentationStyle{.use_spaces = true, .width = 4});

    EXPECT_EQ(fixed.lines,
              (std::vector<std::string>{"def f():", "    return 1", "      x", "", "        y"}));
}

TEST(IndentationTest, NormalisesToTabsKeepingRemainder)
{
    auto document = create_document({"        a", "      b", "\t c"});

    auto fixed = normalize_indentation(document, IndentationStyle{.use_spaces = false, .width = 4});

    EXPECT_EQ(fixed.lines, (std::vector<std::string>{"\t\ta", "\t  b", "\t c"}));
}

TEST(IndentationTest, NormalisationKeepsDocumentMetadata)
{
    auto document = parse_document("if x:\r\n\ty\r\n");

    auto fixed = normalize_indentation(document, IndentationStyle{});

    EXPECT_EQ(render_document(fixed), "if x:\r\n    y\r\n");
}

TEST(IndentationTest, DescribeConsistentFile)
{
    auto analysis = analyze_indentation(create_document({"x = 1"}));

    EXPECT_THAT(describe_analysis(analysis), ::testing::HasSubstr("Indentation is consistent"));
}

} // namespace anchorpatch
