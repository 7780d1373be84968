#include "core/Errors.hpp"
#include "core/ResultClassifier.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace flux_mcp;
using json = nlohmann::json;

namespace {

const std::string kReplacementChar = "\xEF\xBF\xBD";

json call(int id, const std::string& name) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "tools/call"},
        {"params", {{"name", name}, {"arguments", json::object()}}}
    };
}

} // namespace

class StdioTransportTest : public ::testing::Test {
protected:
    // Serve one tools/call whose child failed with the given stderr
    json serve_failure(const std::string& stderr_data) {
        std::istringstream in(call(7, "failing").dump() + "\n");
        MCPServer server(std::make_unique<StdioTransport>(in, out_));

        server.register_tool({"failing", "Child exits with 1", {{"type", "object"}}},
            [stderr_data](const json&) -> json {
                InvocationOutcome outcome;
                outcome.exit_code = 1;
                outcome.stderr_data = stderr_data;
                ResultClassifier::classify(outcome);
                return {{"content", json::array()}};
            });

        server.run();

        std::string line;
        std::istringstream lines(out_.str());
        if (!std::getline(lines, line)) {
            return json();
        }
        return json::parse(line);
    }

    std::ostringstream out_;
};

TEST_F(StdioTransportTest, WritesOneLinePerMessage) {
    std::istringstream in;
    StdioTransport transport(in, out_);

    transport.write_message({{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}});
    transport.write_message({{"jsonrpc", "2.0"}, {"id", 2}, {"result", json::object()}});

    EXPECT_EQ(out_.str(),
        "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":{}}\n"
        "{\"id\":2,\"jsonrpc\":\"2.0\",\"result\":{}}\n");
}

TEST_F(StdioTransportTest, InvalidUtf8IsReplacedNotDropped) {
    std::istringstream in;
    StdioTransport transport(in, out_);

    transport.write_message({{"text", std::string("bad \xFF byte")}});

    json written = json::parse(out_.str());
    EXPECT_EQ(written["text"], "bad " + kReplacementChar + " byte");
}

TEST_F(StdioTransportTest, ReadsSkippingBlankLines) {
    std::istringstream in("\n  \n{\"id\":3}\n");
    StdioTransport transport(in, out_);

    EXPECT_EQ(transport.read_message()["id"], 3);
    EXPECT_TRUE(transport.read_message().is_null());
}

TEST_F(StdioTransportTest, WritesAfterCloseAreDropped) {
    std::istringstream in;
    StdioTransport transport(in, out_);

    transport.close();
    transport.write_message({{"id", 1}});

    EXPECT_TRUE(out_.str().empty());
    EXPECT_FALSE(transport.is_open());
}

TEST_F(StdioTransportTest, FailureWithMultiByteTextAtCutIsAnswered) {
    json response = serve_failure(std::string(499, 'x') + "\xC3\xA9 tail");

    ASSERT_FALSE(response.is_null()) << "No response written";
    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["result"]["isError"], true);
    std::string text = response["result"]["content"][0]["text"];
    EXPECT_EQ(text.rfind("ExternalProgramError: ", 0), 0u);
}

TEST_F(StdioTransportTest, FailureWithRawByteOnStderrIsAnswered) {
    json response = serve_failure("Error during API call: \xFF\xFE");

    ASSERT_FALSE(response.is_null()) << "No response written";
    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["result"]["isError"], true);
    std::string text = response["result"]["content"][0]["text"];
    EXPECT_NE(text.find(kReplacementChar), std::string::npos);
}
