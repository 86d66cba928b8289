/**
 * @file test_lookup.cpp
 * @brief Unit tests for the lookup/mutation engine (GoogleTest)
 *
 * Tests cover rules L1-L5:
 * - L1: absence is reported through exists(), never thrown
 * - L2: filter mismatches and structural conflicts always throw
 * - L3: filtered containers are created in place with create=true
 * - L4: filtered scalars are stored as zero values with create=true
 * - L5: non-wildcard results alias the tree; wildcard results are copies
 */

#include <gtest/gtest.h>
#include "treepath/Lookup.hpp"
#include "treepath/Tokenizer.hpp"
#include "treepath/Errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <ctime>
#include <string>
#include <type_traits>
#include <vector>
#include <utility>

using namespace treepath;

namespace {

std::vector<Value> sorted_elements(const Value& arr) {
    std::vector<Value> out(arr.begin(), arr.end());
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

// ============================================================================
// Basic retrieval
// ============================================================================

class LookupTest : public ::testing::Test {
protected:
    Value data = {
        {"data", {
            {"a_array", {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10}},
            {"b_dict", {{"a", "xxx"}, {"b", "yyy"}, {"c", "zzz"}}},
            {"c_array", {{{"v1", "vdata1"}}, {{"v2", "vdata2"}}}}
        }}
    };
};

TEST_F(LookupTest, NestedKey) {
    auto result = lookup(data, "data.b_dict.a");
    ASSERT_TRUE(result.exists());
    EXPECT_EQ(*result, "xxx");
    EXPECT_FALSE(result.is_owned());
}

TEST_F(LookupTest, NamedIndexes) {
    EXPECT_EQ(*lookup(data, "data.a_array.@first"), 0);
    EXPECT_EQ(*lookup(data, "data.a_array.@last"), 10);
}

TEST_F(LookupTest, IntegerIndexes) {
    EXPECT_EQ(*lookup(data, "data.a_array.@1"), 1);
    EXPECT_EQ(*lookup(data, "data.a_array.@-2"), 9);
}

TEST_F(LookupTest, NamedIndexesMatchIntegerForms) {
    EXPECT_EQ(lookup(data, "data.a_array.@first").get(), lookup(data, "data.a_array.@0").get());
    EXPECT_EQ(lookup(data, "data.a_array.@last").get(), lookup(data, "data.a_array.@-1").get());
}

TEST_F(LookupTest, IndexThenKey) {
    EXPECT_EQ(*lookup(data, "data.c_array.@1.v2"), "vdata2");
}

TEST_F(LookupTest, EmptyPathReturnsRoot) {
    EXPECT_EQ(lookup(data, "").get(), &data);
    EXPECT_EQ(lookup(data, ".").get(), &data);
}

TEST_F(LookupTest, ConstTreeYieldsConstResult) {
    const Value& cdata = data;
    auto result = lookup(cdata, "data.b_dict.b");
    static_assert(std::is_same_v<decltype(result), ConstLookupResult>);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.get(), &data["data"]["b_dict"]["b"]);
}

TEST_F(LookupTest, MovedFromResultIsAbsent) {
    auto alias = lookup(data, "data.b_dict.b");
    ASSERT_TRUE(alias);
    LookupResult moved(std::move(alias));
    EXPECT_FALSE(alias.exists());
    EXPECT_EQ(alias.get(), nullptr);
    EXPECT_EQ(moved.get(), &data["data"]["b_dict"]["b"]);

    auto projection = lookup(data, "data.b_dict.*");
    ASSERT_TRUE(projection.is_owned());
    const Value* owned = projection.get();
    LookupResult target;
    target = std::move(projection);
    EXPECT_FALSE(projection.exists());
    EXPECT_FALSE(projection.is_owned());
    EXPECT_EQ(target.get(), owned);
    EXPECT_TRUE(target.is_owned());
}

// ============================================================================
// Absence (RULE L1)
// ============================================================================

TEST_F(LookupTest, MissingKeyIsAbsent) {
    auto result = lookup(data, "data.nope");
    EXPECT_FALSE(result.exists());
    EXPECT_EQ(result.get(), nullptr);
}

TEST_F(LookupTest, OutOfRangeIndexIsAbsent) {
    EXPECT_FALSE(lookup(data, "data.a_array.@100"));
    EXPECT_FALSE(lookup(data, "data.a_array.@-12"));
}

TEST(LookupAbsence, IndexIntoMappingIsAbsent) {
    Value d = {{"1", "1"}, {"2", "2"}};
    EXPECT_FALSE(lookup(d, "@1"));
}

TEST(LookupAbsence, IndexIntoEmptySequenceIsAbsent) {
    Value d = Value::array();
    EXPECT_FALSE(lookup(d, "@first"));
}

TEST(LookupAbsence, KeyIntoScalarOrSequenceIsAbsent) {
    Value d = {{"name", "value"}, {"list", {1, 2}}};
    EXPECT_FALSE(lookup(d, "name.sub"));
    EXPECT_FALSE(lookup(d, "list.sub"));
}

TEST(LookupAbsence, WildcardOverScalarIsAbsent) {
    Value d = {{"n", 5}};
    EXPECT_FALSE(lookup(d, "n.*"));
}

TEST(LookupAbsence, ValueOrFallsBack) {
    Value d = {{"a", 1}};
    EXPECT_EQ(lookup(d, "b").value_or("fallback"), "fallback");
    EXPECT_EQ(lookup(d, "a").value_or("fallback"), 1);
}

TEST(LookupAbsence, MalformedIndexIsSyntaxError) {
    Value d = Value::array({1, 2});
    EXPECT_THROW(lookup(d, "@wat"), SyntaxError);
}

// ============================================================================
// Aliasing and wildcard projection (RULE L5)
// ============================================================================

TEST_F(LookupTest, WritesThroughAliasAreVisible) {
    auto result = lookup(data, "data.c_array.@0.v1");
    ASSERT_TRUE(result);
    *result = "changed";
    EXPECT_EQ(data["data"]["c_array"][0]["v1"], "changed");
}

TEST_F(LookupTest, SequenceWildcardIsOrderedCopy) {
    auto result = lookup(data, "data.a_array.*");
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.is_owned());
    EXPECT_EQ(*result, data["data"]["a_array"]);
    ASSERT_EQ(result->size(), 11u);

    (*result)[0] = 100;
    EXPECT_EQ(data["data"]["a_array"][0], 0);
}

TEST_F(LookupTest, MappingWildcardCollectsValues) {
    auto result = lookup(data, "data.b_dict.*");
    ASSERT_TRUE(result);
    EXPECT_EQ(sorted_elements(*result), (std::vector<Value>{"xxx", "yyy", "zzz"}));
}

TEST_F(LookupTest, MappingWildcardFollowsKeyOrder) {
    Value d = {{"zeta", 1}, {"alpha", 2}, {"mid", 3}};
    EXPECT_EQ(*lookup(d, "*"), Value::array({2, 3, 1}));
}

TEST(LookupWildcard, TopLevelMapping) {
    Value d = {{"t1", 1}, {"t2", 2}, {"t3", 3}, {"t4", 4}};
    auto result = lookup(d, "*");
    ASSERT_TRUE(result);
    EXPECT_EQ(sorted_elements(*result), (std::vector<Value>{1, 2, 3, 4}));
}

TEST(LookupWildcard, SubPathFiltersElements) {
    Value d = {{"l1", {{{"s", 5}, {"r", ""}}, {{"s", 6}, {"r", ""}}, {{"s", 7}}}}};
    EXPECT_EQ(*lookup(d, "l1.*.s"), Value::array({5, 6, 7}));
    EXPECT_EQ(*lookup(d, "l1.*.r"), Value::array({"", ""}));
}

TEST(LookupWildcard, SubPathOverMappingValues) {
    Value d = {{"l1", {
        {"t0", {{"s", 5}, {"r", ""}}},
        {"t1", {{"s", 6}, {"r", ""}}},
        {"t2", {{"s", 7}}}
    }}};
    auto result = lookup(d, "l1.*.s");
    ASSERT_TRUE(result);
    EXPECT_EQ(sorted_elements(*result), (std::vector<Value>{5, 6, 7}));
}

TEST(LookupWildcard, NoMatchesYieldsEmptyProjection) {
    Value d = {{"l1", {1, 2, 3}}};
    auto result = lookup(d, "l1.*.missing");
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->is_array());
    EXPECT_TRUE(result->empty());
}

TEST(LookupWildcard, NestedWildcards) {
    Value d = {{"m", {{1, 2}, {3}}}};
    EXPECT_EQ(*lookup(d, "m.*.*"), Value::parse("[[1, 2], [3]]"));
}

// ============================================================================
// Escaping
// ============================================================================

TEST(LookupEscape, EscapedSeparator) {
    Value d = {{"v.v", {{"t", 31}}}};
    EXPECT_EQ(*lookup(d, "v\\.v.t"), 31);
}

TEST(LookupEscape, TwoEscapedSeparators) {
    Value d = {{"v.v", {{"t.t", 31}}}};
    EXPECT_EQ(*lookup(d, "v\\.v.t\\.t"), 31);
}

TEST(LookupEscape, EscapedSeparatorInLastSegment) {
    Value d = {{"v", {{"t.t", 31}}}};
    EXPECT_EQ(*lookup(d, "v.t\\.t"), 31);
}

TEST(LookupEscape, EscapedIndexMarker) {
    Value d = {{"v", {{"@id", 31}}}};
    EXPECT_EQ(*lookup(d, "v.\\@id"), 31);
}

TEST(LookupEscape, EscapedEscapeBeforeIndexMarker) {
    Value d = {{"v", {{"\\@id", 31}}}};
    EXPECT_EQ(*lookup(d, "v.\\\\\\@id"), 31);
    EXPECT_EQ(*lookup(d, "v.\\\\@id"), 31);
}

TEST(LookupEscape, DoubleEscapedEscape) {
    Value d = {{"v", {{"\\\\@id", 31}}}};
    EXPECT_EQ(*lookup(d, "v.\\\\\\\\@id"), 31);
}

TEST(LookupEscape, EscapedWildcard) {
    Value d = {{"v", {{"*id", 31}, {"*", 32}}}};
    EXPECT_EQ(*lookup(d, "v.\\*id"), 31);
    EXPECT_EQ(*lookup(d, "v.\\*"), 32);
}

TEST(LookupEscape, EscapedEscapeAlone) {
    Value d = {{"v", {{"\\", 31}}}};
    EXPECT_EQ(*lookup(d, "v.\\\\"), 31);
}

TEST(LookupEscape, EscapedKeysRoundTrip) {
    const std::vector<std::string> keys = {
        "a.b", "@x", "*", "\\", "x$", "y#", "z%", "m{}", "s[]", "t()",
        "a.b.@c*$", "\\.", "trail\\", "{}", "$"
    };
    for (const auto& key : keys) {
        Value d = {{"outer", {{key, key + "-value"}}}};
        auto result = lookup(d, "outer." + escape_key(key));
        ASSERT_TRUE(result) << "key: " << key;
        EXPECT_EQ(*result, key + "-value") << "key: " << key;
    }
}

// ============================================================================
// Type filters on existing values (RULE L2)
// ============================================================================

TEST(LookupFilter, EscapedSuffixIsPartOfKey) {
    EXPECT_EQ(*lookup(Value{{"a$", "v"}}, "a\\$"), "v");
    EXPECT_EQ(*lookup(Value{{"a#", 123}}, "a\\#"), 123);
    EXPECT_EQ(*lookup(Value{{"a%", 0.1}}, "a\\%"), 0.1);
    EXPECT_EQ(*lookup(Value{{"a{}", {{"1", 1}}}}, "a\\{}"), Value({{"1", 1}}));
    EXPECT_EQ(*lookup(Value{{"a[]", {1}}}, "a\\[]"), Value::array({1}));
}

TEST(LookupFilter, MatchingFilterPasses) {
    Value d = {{"s", "text"}, {"n", 5}, {"f", 1.5}, {"o", Value::object()}, {"l", {1}}};
    EXPECT_EQ(*lookup(d, "s$"), "text");
    EXPECT_EQ(*lookup(d, "n#"), 5);
    EXPECT_EQ(*lookup(d, "f%"), 1.5);
    EXPECT_TRUE(lookup(d, "o{}")->is_object());
    EXPECT_TRUE(lookup(d, "l[]")->is_array());
    EXPECT_TRUE(lookup(d, "l()")->is_array());
}

TEST(LookupFilter, MismatchIsTypeMismatchError) {
    Value d = {{"n", 5}, {"b", true}, {"s", "x"}};
    EXPECT_THROW(lookup(d, "n$"), TypeMismatchError);
    EXPECT_THROW(lookup(d, "n%"), TypeMismatchError);
    EXPECT_THROW(lookup(d, "b#"), TypeMismatchError);
    EXPECT_THROW(lookup(d, "s{}"), TypeMismatchError);
}

TEST(LookupFilter, MismatchThrowsEvenWhenKeyLaterMissing) {
    Value d = {{"n", 5}};
    EXPECT_THROW(lookup(d, "n{}.missing"), TypeMismatchError);
}

TEST(LookupFilter, IndexElementMismatch) {
    Value d = Value::array({Value::object()});
    EXPECT_THROW(lookup(d, "@first[]"), TypeMismatchError);
    EXPECT_THROW(lookup(d, "@-1[]", true), TypeMismatchError);
    EXPECT_TRUE(lookup(d, "@0{}")->is_object());
}

TEST(LookupFilter, FilteredIndexOnNonSequence) {
    Value d = Value::object();
    EXPECT_THROW(lookup(d, "@first[]"), TypeMismatchError);

    Value empty = Value::array();
    EXPECT_THROW(lookup(empty, "@first#"), TypeMismatchError);
}

TEST(LookupFilter, ErrorCarriesTypes) {
    Value d = {{"db", {{"host", "localhost"}}}};
    try {
        lookup(d, "db.host#");
        FAIL() << "Should have thrown TypeMismatchError";
    } catch (const TypeMismatchError& e) {
        EXPECT_EQ(e.path(), "db.host#");
        EXPECT_EQ(e.expected(), "integer");
        EXPECT_EQ(e.actual(), "string");
    }
}

// ============================================================================
// Structural conflicts (RULE L2)
// ============================================================================

TEST(LookupConflict, FilteredKeyOnSequence) {
    Value d = Value::array();
    EXPECT_THROW(lookup(d, "a{}", true), StructuralConflictError);
    EXPECT_THROW(lookup(d, "a{}"), StructuralConflictError);
}

TEST(LookupConflict, FilteredKeyOnScalar) {
    Value d = {{"s", "text"}};
    EXPECT_THROW(lookup(d, "s.a$"), StructuralConflictError);
}

TEST(LookupConflict, CreationOverExistingScalar) {
    Value d = {{"a", 1}};
    EXPECT_THROW(lookup(d, "a[]", true), StructuralConflictError);
    EXPECT_EQ(d, Value({{"a", 1}}));
}

TEST(LookupConflict, CreationOverExistingContainer) {
    Value d = {{"a", Value::array()}};
    EXPECT_THROW(lookup(d, "a{}", true), StructuralConflictError);
}

TEST(LookupConflict, SameMismatchWithoutCreationIsTypeMismatch) {
    Value d = {{"a", 1}};
    EXPECT_THROW(lookup(d, "a[]"), TypeMismatchError);
}

TEST(LookupConflict, ErrorNamesSegment) {
    Value d = {{"list", {1, 2}}};
    try {
        lookup(d, "list.name{}", true);
        FAIL() << "Should have thrown StructuralConflictError";
    } catch (const StructuralConflictError& e) {
        EXPECT_EQ(e.path(), "list.name{}");
        EXPECT_EQ(e.segment(), "name{}");
    }
}

// ============================================================================
// Auto-vivification (RULES L3/L4)
// ============================================================================

TEST(LookupCreate, NestedMappings) {
    Value d = Value::object();
    lookup(d, "a{}.b{}.c{}", true);
    EXPECT_EQ(d, Value::parse(R"({"a": {"b": {"c": {}}}})"));
}

TEST(LookupCreate, MappingsThenSequence) {
    Value d = Value::object();
    auto result = lookup(d, "a{}.b{}.c[]", true);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, Value::array());
    EXPECT_EQ(d, Value::parse(R"({"a": {"b": {"c": []}}})"));
}

TEST(LookupCreate, CreatedContainerIsAliased) {
    Value d = Value::object();
    auto result = lookup(d, "items[]", true);
    ASSERT_TRUE(result);
    EXPECT_FALSE(result.is_owned());
    result->push_back(1);
    EXPECT_EQ(d["items"], Value::array({1}));
}

TEST(LookupCreate, TupleCreatesSequence) {
    Value d = Value::object();
    lookup(d, "t()", true);
    EXPECT_EQ(d["t"], Value::array());
}

TEST(LookupCreate, PreservesExistingStructure) {
    Value d = {{"a", {{"x", 1}}}};
    lookup(d, "a{}.b[]", true);
    EXPECT_EQ(d, Value::parse(R"({"a": {"x": 1, "b": []}})"));
}

TEST(LookupCreate, ReadModeNeverMutates) {
    Value d = Value::object();
    EXPECT_FALSE(lookup(d, "a{}.b{}"));
    EXPECT_EQ(d, Value::object());
}

TEST(LookupCreate, ScalarFiltersStoreZeroValues) {
    Value d = {{"a$", "a"}};
    EXPECT_FALSE(lookup(d, "a$"));

    auto str = lookup(d, "a$", true);
    ASSERT_TRUE(str);
    EXPECT_FALSE(str.is_owned());
    EXPECT_EQ(*str, "");
    EXPECT_EQ(d, Value::parse(R"({"a$": "a", "a": ""})"));

    *str = "filled";
    EXPECT_EQ(d["a"], "filled");

    Value n = {{"a$", 123}};
    EXPECT_EQ(*lookup(n, "count#", true), 0);
    EXPECT_TRUE(lookup(n, "ratio%", true)->is_number_float());
    EXPECT_EQ(n, Value::parse(R"({"a$": 123, "count": 0, "ratio": 0.0})"));
}

TEST(LookupCreate, StoredScalarIsFoundAgain) {
    Value d = Value::object();
    lookup(d, "cfg{}.name$", true);
    EXPECT_EQ(*lookup(d, "cfg.name$"), "");
    EXPECT_THROW(lookup(d, "cfg.name#", true), TypeMismatchError);
}

TEST(LookupCreate, WildcardPropagatesCreation) {
    Value d = {{"x", Value::object()}, {"y", Value::object()}};
    auto result = lookup(d, "*.c[]", true);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, Value::parse("[[], []]"));
    EXPECT_EQ(d, Value::parse(R"({"x": {"c": []}, "y": {"c": []}})"));
}

TEST(LookupCreate, ConstTreeIsNeverCreated) {
    const Value d = Value::object();
    EXPECT_FALSE(lookup(d, "a{}"));
}

TEST(Contains, ReportsExistence) {
    const Value d = Value::parse(R"({"a": {"b": [1, null]}})");
    EXPECT_TRUE(contains(d, "a.b.@last"));
    EXPECT_TRUE(contains(d, ""));
    EXPECT_FALSE(contains(d, "a.c"));
    EXPECT_FALSE(contains(d, "a.b.@2"));
    EXPECT_THROW(contains(d, "a{}.b{}"), TypeMismatchError);
}

// ============================================================================
// Diagnostics
// ============================================================================

namespace {

/**
 * @brief Collects log messages while registered with glog
 */
class CapturingSink : public google::LogSink {
public:
    CapturingSink() { google::AddLogSink(this); }
    ~CapturingSink() override { google::RemoveLogSink(this); }

    void send(google::LogSeverity, const char*, const char*, int,
              const struct ::tm*, const char* message, size_t message_len) override {
        messages.emplace_back(message, message_len);
    }

    bool saw(const std::string& fragment) const {
        return std::any_of(messages.begin(), messages.end(), [&](const std::string& m) {
            return m.find(fragment) != std::string::npos;
        });
    }

    std::vector<std::string> messages;
};

/**
 * @brief Raises the glog verbosity for one scope
 */
class VerbosityGuard {
public:
    explicit VerbosityGuard(int level) : saved_(FLAGS_v) { FLAGS_v = level; }
    ~VerbosityGuard() { FLAGS_v = saved_; }

private:
    int saved_;
};

} // namespace

TEST(LookupDiagnostics, SegmentTraceAtVerbosityTwo) {
    VerbosityGuard verbose(2);
    CapturingSink sink;
    Value d = {{"cfg", {{"port", 80}}}};
    lookup(d, "cfg.port");
    EXPECT_TRUE(sink.saw("Segment 'cfg'"));
    EXPECT_TRUE(sink.saw("Segment 'port'"));
}

TEST(LookupDiagnostics, CreationIsLogged) {
    VerbosityGuard verbose(1);
    CapturingSink sink;
    Value d = Value::object();
    lookup(d, "cfg{}", true);
    EXPECT_TRUE(sink.saw("Created object at key 'cfg'"));
    EXPECT_FALSE(sink.saw("Segment 'cfg'"));
}
