#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "plist_error.hpp"
#include "plist_validator.hpp"

using namespace plistkit;

namespace {

std::string invalidMessage(const PlistValidator& validator, const Value& root) {
    try {
        validator.validate(&root);
    } catch (const InvalidPlistError& e) {
        return e.what();
    }
    return "";
}

}  // namespace

TEST(PlistValidatorTest, NothingParsed) {
    PlistValidator validator;
    EXPECT_THROW(validator.validate(nullptr), PlistNotParsedError);
}

TEST(PlistValidatorTest, EmptyRootIsInvalid) {
    PlistValidator validator;
    EXPECT_EQ(invalidMessage(validator, Value(Dict())), "empty");
    EXPECT_EQ(invalidMessage(validator, Value(Array{})), "empty");
}

TEST(PlistValidatorTest, NoSchemaAcceptsAnyNonEmptyRoot) {
    PlistValidator validator;
    Value array(Array{1});
    Value text("x");
    EXPECT_NO_THROW(validator.validate(&array));
    EXPECT_NO_THROW(validator.validate(&text));
}

TEST(PlistValidatorTest, SchemaAccepts) {
    PlistValidator validator(Schema{{"catalogs", ValueType::Array}, {"name", ValueType::String}});
    Value root(Dict{{"catalogs", Array{"production"}}, {"name", "Foo"}, {"extra", 1}});
    EXPECT_NO_THROW(validator.validate(&root));
}

TEST(PlistValidatorTest, MissingKey) {
    PlistValidator validator(Schema{{"catalogs", ValueType::Array}});
    EXPECT_EQ(invalidMessage(validator, Value(Dict{{"name", "Foo"}})), "Missing element catalogs");
}

TEST(PlistValidatorTest, WrongType) {
    PlistValidator validator(Schema{{"catalogs", ValueType::Array}});
    EXPECT_EQ(invalidMessage(validator, Value(Dict{{"catalogs", "production"}})),
              "Invalid type for element catalogs. Got string, expected array");
}

TEST(PlistValidatorTest, SchemaNeedsDictRoot) {
    PlistValidator validator(Schema{{"catalogs", ValueType::Array}});
    EXPECT_EQ(invalidMessage(validator, Value(Array{1})), "Root is array, expected dict");
}

TEST(PlistValidatorTest, HooksRunInOrderAfterSchema) {
    PlistValidator validator;
    std::vector<int> calls;
    validator.addHook([&calls] { calls.push_back(1); });
    validator.addHook([&calls] { calls.push_back(2); });
    EXPECT_EQ(validator.hookCount(), 2u);

    Value root(Array{1});
    validator.validate(&root);
    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
}

TEST(PlistValidatorTest, HookFailureStopsValidation) {
    PlistValidator validator;
    bool second = false;
    validator.addHook([] { throw InvalidPlistError("hook says no"); });
    validator.addHook([&second] { second = true; });

    Value root(Array{1});
    EXPECT_EQ(invalidMessage(validator, root), "hook says no");
    EXPECT_FALSE(second);
}

TEST(PlistValidatorTest, HooksDoNotRunWhenSchemaFails) {
    PlistValidator validator(Schema{{"catalogs", ValueType::Array}});
    bool called = false;
    validator.addHook([&called] { called = true; });

    Value root(Dict{{"name", "Foo"}});
    EXPECT_THROW(validator.validate(&root), InvalidPlistError);
    EXPECT_FALSE(called);
}

TEST(PlistValidatorTest, SetSchemaReplaces) {
    PlistValidator validator(Schema{{"catalogs", ValueType::Array}});
    validator.setSchema({});
    EXPECT_TRUE(validator.schema().empty());

    Value root(Dict{{"name", "Foo"}});
    EXPECT_NO_THROW(validator.validate(&root));
}
