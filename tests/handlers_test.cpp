//! # Handler Tests
//!
//! Flag extraction, validation pattern cleanup, invalid character detection
//! and each kind's handler applied to its canonical match.

#include "errlens/classify/handlers.hpp"
#include "errlens/classify/registry.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace errlens;
using namespace errlens::classify;

// ============================================================================
// Flag Tokens
// ============================================================================

TEST(FlagNamesTest, ExtractsFlagsInOrder) {
    auto names = extract_flag_names("the following arguments are required: --vm-name, --nic");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "vm-name");
    EXPECT_EQ(names[1], "nic");
}

TEST(FlagNamesTest, SkipsAliasesAfterSlash) {
    auto names = extract_flag_names("required: --name/-n/--resource-group/-g");
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "name");
}

TEST(FlagNamesTest, ShortFlagsAreIgnored) {
    auto names = extract_flag_names("required: --resource-group/-g, --name/-n");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "resource-group");
    EXPECT_EQ(names[1], "name");
}

TEST(FlagNamesTest, FlagMustStartWithLowercaseLetter) {
    EXPECT_TRUE(extract_flag_names("--Name --1st -- --").empty());
}

TEST(FlagNamesTest, JoinWithAnd) {
    EXPECT_EQ(join_flag_names({}), "");
    EXPECT_EQ(join_flag_names({"name"}), "name");
    EXPECT_EQ(join_flag_names({"resource-group", "name"}), "resource-group and name");
    EXPECT_EQ(join_flag_names({"a", "b", "c"}), "a and b and c");
}

// ============================================================================
// Validation Patterns
// ============================================================================

TEST(ValidationPatternTest, StripsAnchors) {
    EXPECT_EQ(normalize_validation_pattern(R"(^[-\w\._\(\)]+$)"), R"([-\w\._\(\)]+)");
}

TEST(ValidationPatternTest, CollapsesDoubledBackslashes) {
    EXPECT_EQ(normalize_validation_pattern(R"(^[-\\w\\._]+$)"), R"([-\w\._]+)");
}

TEST(ValidationPatternTest, KeepsEscapedDollar) {
    EXPECT_EQ(normalize_validation_pattern(R"([a-z]+\$)"), R"([a-z]+\$)");
}

TEST(ValidationPatternTest, UnanchoredPatternUnchanged) {
    EXPECT_EQ(normalize_validation_pattern("[a-z0-9]+"), "[a-z0-9]+");
}

// ============================================================================
// Invalid Character Detection
// ============================================================================

TEST(InvalidCharactersTest, FindsUncoveredCharacters) {
    auto found = find_invalid_characters("sampleUX!!group", R"([-\w\._\(\)]+)");
    ASSERT_TRUE(is_ok(found));

    const auto& invalid = unwrap(found);
    EXPECT_EQ(invalid.distinct, "!");
    EXPECT_EQ(invalid.corrected, "sampleUXgroup");
}

TEST(InvalidCharactersTest, DistinctInFirstSeenOrder) {
    auto found = find_invalid_characters("a#b!c#d?", "[a-z]+");
    ASSERT_TRUE(is_ok(found));

    const auto& invalid = unwrap(found);
    EXPECT_EQ(invalid.distinct, "#!?");
    EXPECT_EQ(invalid.corrected, "abcd");
}

TEST(InvalidCharactersTest, ValidValueHasNoInvalidCharacters) {
    auto found = find_invalid_characters("my-group_01", R"([-\w\._\(\)]+)");
    ASSERT_TRUE(is_ok(found));

    EXPECT_TRUE(unwrap(found).distinct.empty());
    EXPECT_EQ(unwrap(found).corrected, "my-group_01");
}

TEST(InvalidCharactersTest, EmptyValue) {
    auto found = find_invalid_characters("", "[a-z]+");
    ASSERT_TRUE(is_ok(found));
    EXPECT_TRUE(unwrap(found).distinct.empty());
    EXPECT_TRUE(unwrap(found).corrected.empty());
}

TEST(InvalidCharactersTest, InvalidPatternIsError) {
    auto found = find_invalid_characters("value", "[a-z");
    ASSERT_TRUE(is_err(found));
    EXPECT_NE(unwrap_err(found).find("cannot compile validation pattern"), std::string::npos);
}

TEST(InvalidCharactersTest, MultiByteCharactersStayWhole) {
    auto found = find_invalid_characters("gr\u00fcpp\u00e9", R"([-\w.()]+)");
    ASSERT_TRUE(is_ok(found));

    const auto& invalid = unwrap(found);
    EXPECT_EQ(invalid.distinct, "\u00fc\u00e9");
    EXPECT_EQ(invalid.corrected, "grpp");
}

TEST(InvalidCharactersTest, RepeatedMultiByteCharacterReportedOnce) {
    auto found = find_invalid_characters("a\u20acb\u20acc\u00e9", "[a-z]+");
    ASSERT_TRUE(is_ok(found));

    const auto& invalid = unwrap(found);
    EXPECT_EQ(invalid.distinct, "\u20ac\u00e9");
    EXPECT_EQ(invalid.corrected, "abc");
}

TEST(InvalidCharactersTest, MalformedByteIsOneCharacter) {
    // Lone continuation byte
    auto found = find_invalid_characters(std::string("ab\xA9" "c"), "[a-z]+");
    ASSERT_TRUE(is_ok(found));

    EXPECT_EQ(unwrap(found).distinct, std::string("\xA9"));
    EXPECT_EQ(unwrap(found).corrected, "abc");
}

TEST(InvalidCharactersTest, OverlongValueIsError) {
    std::string value = std::string(30000, 'a') + "!";
    auto found = find_invalid_characters(value, "(a|a)*");

    ASSERT_TRUE(is_err(found));
    EXPECT_NE(unwrap_err(found).find("exceeds the search limit"), std::string::npos);
}

// ============================================================================
// Handlers
// ============================================================================

class HandlerTest : public ::testing::Test {
protected:
    ErrorKindRegistry registry = ErrorKindRegistry::canonical();

    MatchGroups match(ErrorKindId id, const std::string& message) {
        const ErrorKind* kind = registry.find(id);
        EXPECT_NE(kind, nullptr);
        auto found = kind->search(message);
        EXPECT_TRUE(found.has_value()) << message;
        return *found;
    }
};

TEST_F(HandlerTest, ResourceNotFound) {
    std::string message = "Resource group 'newsampleUXgroup' could not be found.";
    auto result = handle_resource_not_found(match(ErrorKindId::ResourceNotFound, message), message,
                                            {});

    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    EXPECT_EQ(std::get<std::string>(result), "newsampleUXgroup does not exist");
}

TEST_F(HandlerTest, CommandNotFound) {
    std::string message = R"(az storage: "create" is not in the "az storage" command group.)";
    auto result = handle_command_not_found(match(ErrorKindId::CommandNotFound, message), message,
                                           {});

    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    EXPECT_EQ(std::get<std::string>(result), "az storage create");
}

TEST_F(HandlerTest, ArgumentRequired) {
    std::string message =
        "the following arguments are required: --resource-group/-g, --name/-n";
    auto result = handle_argument_required(match(ErrorKindId::ArgumentRequired, message), message,
                                           {});

    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    EXPECT_EQ(std::get<std::string>(result), "resource-group and name");
}

TEST_F(HandlerTest, ArgumentRequiredWithoutFlagsDeclines) {
    std::string message = "the following arguments are required: NAME";
    auto result = handle_argument_required(match(ErrorKindId::ArgumentRequired, message), message,
                                           {});
    EXPECT_TRUE(is_no_rewrite(result));
}

TEST_F(HandlerTest, ValueRequired) {
    std::string message = "argument --connection-string: expected one argument";
    auto result = handle_value_required(match(ErrorKindId::ValueRequired, message), message, {});

    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    EXPECT_EQ(std::get<std::string>(result), "connection-string");
}

TEST_F(HandlerTest, ValueRequiredUsesFirstFlag) {
    std::string message = "argument --ids --names: expected at least one argument";
    auto result = handle_value_required(match(ErrorKindId::ValueRequired, message), message, {});

    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    EXPECT_EQ(std::get<std::string>(result), "ids");
}

// ============================================================================
// Character Not Allowed
// ============================================================================

class CharacterNotAllowedTest : public HandlerTest {
protected:
    const std::string message =
        R"(validation error: Parameter 'resource_group_name' must conform to the following pattern: '^[-\w\._\(\)]+$'.)";
};

TEST_F(CharacterNotAllowedTest, ReportsCharactersAndSuggestsCleanValue) {
    Metadata metadata = {{RaisedError::kInvalidValueKey, "sampleUX!!group"}};
    auto result = handle_character_not_allowed(match(ErrorKindId::CharacterNotAllowed, message),
                                               message, metadata);

    ASSERT_TRUE(std::holds_alternative<MessageWithCorrection>(result));
    const auto& rewrite = std::get<MessageWithCorrection>(result);
    EXPECT_EQ(rewrite.message, "!");
    EXPECT_EQ(rewrite.correction.suggestion(), "sampleUXgroup");
    EXPECT_EQ(rewrite.correction.kind(), CorrectionKind::InvalidArgument);
    ASSERT_TRUE(rewrite.correction.parameter().has_value());
    EXPECT_EQ(*rewrite.correction.parameter(), "--resource-group");
}

TEST_F(CharacterNotAllowedTest, DeclinesWithoutInvalidValue) {
    auto result = handle_character_not_allowed(match(ErrorKindId::CharacterNotAllowed, message),
                                               message, {});
    EXPECT_TRUE(is_no_rewrite(result));
}

TEST_F(CharacterNotAllowedTest, DeclinesWhenValueIsValid) {
    Metadata metadata = {{RaisedError::kInvalidValueKey, "sampleUXgroup"}};
    auto result = handle_character_not_allowed(match(ErrorKindId::CharacterNotAllowed, message),
                                               message, metadata);
    EXPECT_TRUE(is_no_rewrite(result));
}

TEST_F(CharacterNotAllowedTest, DeclinesOnBrokenPattern) {
    std::string broken = "Parameter 'name' must conform to the following pattern: '^[a-z+$'.";
    Metadata metadata = {{RaisedError::kInvalidValueKey, "Bad!"}};
    auto result = handle_character_not_allowed(match(ErrorKindId::CharacterNotAllowed, broken),
                                               broken, metadata);
    EXPECT_TRUE(is_no_rewrite(result));
}

// ============================================================================
// Rewrite Results
// ============================================================================

TEST(RewriteResultTest, EmptyStringCountsAsNoRewrite) {
    EXPECT_TRUE(is_no_rewrite(RewriteResult{NoRewrite{}}));
    EXPECT_TRUE(is_no_rewrite(RewriteResult{std::string()}));
    EXPECT_FALSE(is_no_rewrite(RewriteResult{std::string("name")}));
}
