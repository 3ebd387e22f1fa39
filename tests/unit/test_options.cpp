#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/station_errors.hpp"
#include "interaction/options.hpp"
#include "protocol/interaction_contract.hpp"

namespace {

using station::core::errors::ErrorCategory;
using station::core::errors::get_error;
using station::core::errors::get_value;
using station::core::errors::is_error;
using station::interaction::normalize_options;
using station::interaction::OptionSpec;
using station::interaction::resolve_response;
using station::protocol::InteractionKind;
using station::protocol::InteractionRequest;
using station::protocol::Option;
using nlohmann::json;

InteractionRequest make_request(InteractionKind kind, std::vector<OptionSpec> options,
                                 bool allow_multiple = false) {
    InteractionRequest request;
    request.id = "req-7";
    request.kind = kind;
    request.prompt = "Pick";
    request.options = normalize_options(options);
    request.allow_multiple = allow_multiple;
    return request;
}

TEST(OptionsTest, NormalizesBareLabelsAndPairs) {
    const auto options = normalize_options({"Button 1", {"Green", true}, {"Answer", 42}});
    ASSERT_EQ(options.size(), 3u);
    EXPECT_EQ(options[0].name, "Button 1");
    EXPECT_EQ(options[0].value, json("Button 1"));
    EXPECT_EQ(options[1].name, "Green");
    EXPECT_EQ(options[1].value, json(true));
    EXPECT_EQ(options[2].value, json(42));
}

TEST(OptionsTest, ButtonsResolveToChosenValue) {
    const auto request = make_request(InteractionKind::Buttons, {{"A", 1}, {"B", 2}});
    auto response = resolve_response(request, json(2));
    ASSERT_FALSE(is_error(response));
    EXPECT_EQ(get_value(response).value, json(2));
    EXPECT_EQ(get_value(response).request_id, "req-7");
}

TEST(OptionsTest, ButtonsRejectValueNotOffered) {
    const auto request = make_request(InteractionKind::Buttons, {{"A", 1}, {"B", 2}});
    auto response = resolve_response(request, json(99));
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).category, ErrorCategory::Infrastructure);
    EXPECT_EQ(get_error(response).code, "invalid_response");
}

TEST(OptionsTest, ValueTypeMustMatchExactly) {
    const auto request = make_request(InteractionKind::Buttons, {{"A", 1}, {"B", 2}});
    auto response = resolve_response(request, json("2"));
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).code, "invalid_response");
}

TEST(OptionsTest, RadiosResolveToSingleOption) {
    const auto request =
        make_request(InteractionKind::Radios, {"Choice 1", "Choice 2", "Choice 3"});
    auto response = resolve_response(request, json("Choice 2"));
    ASSERT_FALSE(is_error(response));
    ASSERT_EQ(get_value(response).selection.size(), 1u);
    EXPECT_EQ(get_value(response).selection[0], (Option{"Choice 2", "Choice 2"}));
}

TEST(OptionsTest, RadiosRejectArraySelection) {
    const auto request = make_request(InteractionKind::Radios, {"Choice 1", "Choice 2"});
    auto response = resolve_response(request, json::array({"Choice 1"}));
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).code, "invalid_response");
}

TEST(OptionsTest, SingleSelectReturnsExactlyOneOption) {
    const auto request = make_request(InteractionKind::Select, {{"Low", 1}, {"High", 2}});
    auto response = resolve_response(request, json(1));
    ASSERT_FALSE(is_error(response));
    ASSERT_EQ(get_value(response).selection.size(), 1u);
    EXPECT_EQ(get_value(response).selection[0].name, "Low");
}

TEST(OptionsTest, MultiSelectCollapsesDuplicatesInOptionOrder) {
    const auto request = make_request(
        InteractionKind::Select, {"Choice 1", "Choice 2", "Choice 3"}, true);
    auto response =
        resolve_response(request, json::array({"Choice 3", "Choice 1", "Choice 3"}));
    ASSERT_FALSE(is_error(response));
    const auto& selection = get_value(response).selection;
    ASSERT_EQ(selection.size(), 2u);
    EXPECT_EQ(selection[0].name, "Choice 1");
    EXPECT_EQ(selection[1].name, "Choice 3");
}

TEST(OptionsTest, MultiSelectRejectsScalar) {
    const auto request = make_request(InteractionKind::Select, {"Choice 1"}, true);
    auto response = resolve_response(request, json("Choice 1"));
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).code, "invalid_response");
}

TEST(OptionsTest, CheckboxesAcceptEmptySelection) {
    const auto request = make_request(InteractionKind::Checkboxes, {"Choice 1", "Choice 2"});
    auto response = resolve_response(request, json::array());
    ASSERT_FALSE(is_error(response));
    EXPECT_TRUE(get_value(response).selection.empty());
}

TEST(OptionsTest, CheckboxesRejectUnknownMember) {
    const auto request = make_request(InteractionKind::Checkboxes, {"Choice 1", "Choice 2"});
    auto response = resolve_response(request, json::array({"Choice 1", "Choice 9"}));
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).code, "invalid_response");
}

TEST(OptionsTest, TextInputRequiresString) {
    InteractionRequest request;
    request.id = "req-1";
    request.kind = InteractionKind::TextInput;

    auto typed = resolve_response(request, json("Ada"));
    ASSERT_FALSE(is_error(typed));
    EXPECT_EQ(get_value(typed).text, "Ada");

    auto wrong = resolve_response(request, json(5));
    ASSERT_TRUE(is_error(wrong));
    EXPECT_EQ(get_error(wrong).code, "invalid_response");
}

TEST(OptionsTest, PassFailResolvesToBool) {
    InteractionRequest request;
    request.id = "req-2";
    request.kind = InteractionKind::PassFail;
    request.options = station::interaction::pass_fail_options();

    auto response = resolve_response(request, json(false));
    ASSERT_FALSE(is_error(response));
    EXPECT_EQ(get_value(response).value, json(false));
}

}  // namespace
