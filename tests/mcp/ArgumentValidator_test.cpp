#include <gtest/gtest.h>
#include "mcp/ArgumentValidator.hpp"
#include <stdexcept>

using namespace flux_mcp;
using json = nlohmann::json;

class ArgumentValidatorTest : public ::testing::Test {
protected:
    json schema = {
        {"type", "object"},
        {"properties", {
            {"prompt", {{"type", "string"}}},
            {"model", {
                {"type", "string"},
                {"enum", json::array({"flux.1.1-pro", "flux.1-dev"})},
                {"default", "flux.1.1-pro"}
            }},
            {"width", {{"type", "integer"}}},
            {"strength", {{"type", "number"}, {"default", 0.85}}},
            {"to_webp", {{"type", "boolean"}, {"default", false}}}
        }},
        {"required", json::array({"prompt"})}
    };
};

TEST_F(ArgumentValidatorTest, FillsDefaults) {
    json result = ArgumentValidator::apply(schema, {{"prompt", "a cat"}});

    EXPECT_EQ(result["prompt"], "a cat");
    EXPECT_EQ(result["model"], "flux.1.1-pro");
    EXPECT_DOUBLE_EQ(result["strength"].get<double>(), 0.85);
    EXPECT_EQ(result["to_webp"], false);
    EXPECT_FALSE(result.contains("width"));
}

TEST_F(ArgumentValidatorTest, ExplicitValuesWin) {
    json result = ArgumentValidator::apply(schema,
        {{"prompt", "a cat"}, {"model", "flux.1-dev"}, {"strength", 0.5}});

    EXPECT_EQ(result["model"], "flux.1-dev");
    EXPECT_DOUBLE_EQ(result["strength"].get<double>(), 0.5);
}

TEST_F(ArgumentValidatorTest, NullTreatedAsMissing) {
    json result = ArgumentValidator::apply(schema, {{"prompt", "a cat"}, {"model", nullptr}});
    EXPECT_EQ(result["model"], "flux.1.1-pro");
}

TEST_F(ArgumentValidatorTest, MissingRequiredRejected) {
    try {
        ArgumentValidator::apply(schema, json::object());
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("prompt"), std::string::npos);
    }
}

TEST_F(ArgumentValidatorTest, NullArgumentsTreatedAsEmpty) {
    EXPECT_THROW(ArgumentValidator::apply(schema, json()), std::invalid_argument);

    json no_required = schema;
    no_required.erase("required");
    EXPECT_NO_THROW(ArgumentValidator::apply(no_required, json()));
}

TEST_F(ArgumentValidatorTest, WrongTypeRejected) {
    EXPECT_THROW(ArgumentValidator::apply(schema, {{"prompt", 42}}), std::invalid_argument);
    EXPECT_THROW(ArgumentValidator::apply(schema, {{"prompt", "x"}, {"width", "wide"}}), std::invalid_argument);
    EXPECT_THROW(ArgumentValidator::apply(schema, {{"prompt", "x"}, {"width", 10.5}}), std::invalid_argument);
    EXPECT_THROW(ArgumentValidator::apply(schema, {{"prompt", "x"}, {"to_webp", "yes"}}), std::invalid_argument);
}

TEST_F(ArgumentValidatorTest, WholeFloatAcceptedAsInteger) {
    EXPECT_NO_THROW(ArgumentValidator::apply(schema, {{"prompt", "x"}, {"width", 1024.0}}));
}

TEST_F(ArgumentValidatorTest, HugeWholeFloatNotAnInteger) {
    EXPECT_THROW(ArgumentValidator::apply(schema, {{"prompt", "x"}, {"width", 1e20}}), std::invalid_argument);
}

TEST_F(ArgumentValidatorTest, ValueOutsideEnumRejected) {
    try {
        ArgumentValidator::apply(schema, {{"prompt", "x"}, {"model", "dall-e"}});
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("model"), std::string::npos);
    }
}

TEST_F(ArgumentValidatorTest, UnknownPropertiesKept) {
    json result = ArgumentValidator::apply(schema, {{"prompt", "x"}, {"extra", 1}});
    EXPECT_EQ(result["extra"], 1);
}

TEST_F(ArgumentValidatorTest, NonObjectArgumentsRejected) {
    EXPECT_THROW(ArgumentValidator::apply(schema, json::array({1, 2})), std::invalid_argument);
}
