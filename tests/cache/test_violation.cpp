/**
 * @file test_violation.cpp
 * @brief Tests for the violation cache record encoding
 */

#include "lintcache/violation.hpp"

#include <gtest/gtest.h>

using namespace lintcache::model;
using json = nlohmann::json;

namespace {

TEST(SeverityName, ParsesKnownNames)
{
    EXPECT_EQ(severity_from_string("warning"), Severity::kWarning);
    EXPECT_EQ(severity_from_string("error"), Severity::kError);
    EXPECT_FALSE(severity_from_string("Warning").has_value());
    EXPECT_FALSE(severity_from_string("").has_value());
    EXPECT_EQ(to_string(Severity::kWarning), "warning");
    EXPECT_EQ(to_string(Severity::kError), "error");
}

TEST(ViolationRecord, UsesCacheFieldNames)
{
    Violation violation{.rule_id = "line_length",
                        .rule_name = "Line Length",
                        .severity = Severity::kWarning,
                        .location = Location{.file = "a.swift", .line = 12, .character = 0},
                        .reason = "Line should be 120 characters or less"};

    json record = to_cache_record(violation);

    EXPECT_EQ(record.at("line"), 12);
    EXPECT_EQ(record.at("character"), 0);
    EXPECT_EQ(record.at("severity"), "warning");
    EXPECT_EQ(record.at("type"), "Line Length");
    EXPECT_EQ(record.at("rule_id"), "line_length");
    EXPECT_EQ(record.at("reason"), "Line should be 120 characters or less");
    EXPECT_FALSE(record.contains("file"));
}

TEST(ViolationRecord, AbsentPositionIsNull)
{
    Violation violation{.rule_id = "file_length",
                        .rule_name = "File Length",
                        .severity = Severity::kError,
                        .location = Location{.file = "a.swift"},
                        .reason = "File is too long"};

    json record = to_cache_record(violation);

    ASSERT_TRUE(record.contains("line"));
    ASSERT_TRUE(record.contains("character"));
    EXPECT_TRUE(record.at("line").is_null());
    EXPECT_TRUE(record.at("character").is_null());

    auto decoded = violation_from_cache_record(record, "a.swift");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, violation);
}

TEST(ViolationRecord, ZeroColumnIsDistinctFromAbsent)
{
    json with_zero = {
        {     "line",         1},
        {"character",         0},
        { "severity", "warning"},
        {     "type",       "A"},
        {  "rule_id",       "a"},
        {   "reason",       "r"}
    };
    json without = with_zero;
    without["character"] = nullptr;

    auto zero = violation_from_cache_record(with_zero, "f");
    auto absent = violation_from_cache_record(without, "f");
    ASSERT_TRUE(zero.has_value());
    ASSERT_TRUE(absent.has_value());
    EXPECT_EQ(zero->location.character, 0);
    EXPECT_FALSE(absent->location.character.has_value());
    EXPECT_NE(*zero, *absent);
}

TEST(ViolationRecord, RejectsIncompleteRecords)
{
    const json complete = {
        { "severity", "warning"},
        {     "type",       "A"},
        {  "rule_id",       "a"},
        {   "reason",       "r"}
    };
    ASSERT_TRUE(violation_from_cache_record(complete, "f").has_value());

    for (const char* key : {"severity", "type", "rule_id", "reason"}) {
        json missing = complete;
        missing.erase(key);
        EXPECT_FALSE(violation_from_cache_record(missing, "f").has_value()) << key;

        json wrong_type = complete;
        wrong_type[key] = 7;
        EXPECT_FALSE(violation_from_cache_record(wrong_type, "f").has_value()) << key;
    }

    EXPECT_FALSE(violation_from_cache_record(json::array(), "f").has_value());
}

TEST(ViolationRecord, OutOfRangePositionReadsAsAbsent)
{
    json record = {
        {     "line", 1ULL << 40U},
        {"character",        -3},
        { "severity",   "error"},
        {     "type",       "A"},
        {  "rule_id",       "a"},
        {   "reason",       "r"}
    };
    auto decoded = violation_from_cache_record(record, "f");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->location.line.has_value());
    EXPECT_EQ(decoded->location.character, -3);
}

}  // namespace
