// test_wire_format.cpp - Unit tests for host/worker control messages

#include <catch2/catch_test_macros.hpp>
#include <codebox/wire_format.h>

using namespace codebox;
using json = nlohmann::json;

namespace {

const std::string kToken = "0123456789abcdef0123456789abcdef";

} // namespace

TEST_CASE("Wire Format - Worker request", "[wire]") {
    WorkerRequest request;
    request.source_code = "print('hi')";
    request.timeout_seconds = 7;
    request.limits.max_output_chars = 123;
    request.disabled_modules = {"sympy"};
    request.channel_token = kToken;

    json encoded = request;
    REQUIRE(encoded["source_code"] == "print('hi')");
    REQUIRE(encoded["limits"]["max_output_chars"] == 123);

    auto decoded = encoded.get<WorkerRequest>();
    REQUIRE(decoded.timeout_seconds == 7);
    REQUIRE(decoded.limits.max_output_chars == 123);
    REQUIRE(decoded.disabled_modules == std::vector<std::string>{"sympy"});
    REQUIRE(decoded.channel_token == kToken);
}

TEST_CASE("Wire Format - Control messages", "[wire]") {
    SECTION("Ready") {
        WorkerReady ready;
        ready.unavailable_modules = {"seaborn"};
        auto message = DecodeControlMessage(EncodeReady(ready, kToken), kToken);
        REQUIRE(message.has_value());
        REQUIRE(message->ready.has_value());
        REQUIRE_FALSE(message->result.has_value());
        REQUIRE(message->ready->unavailable_modules == std::vector<std::string>{"seaborn"});
    }

    SECTION("Result") {
        WorkerResult result;
        result.state = ExecutionState::Faulted;
        result.error = ExecutionError{ErrorKind::GuestRuntimeError, "ValueError: bad", "ValueError"};
        result.variables.push_back({"x", "int", "1", false});
        result.variables_omitted = 2;

        auto message = DecodeControlMessage(EncodeResult(result, kToken), kToken);
        REQUIRE(message.has_value());
        REQUIRE(message->result.has_value());
        REQUIRE(message->result->state == ExecutionState::Faulted);
        REQUIRE(message->result->error->kind == ErrorKind::GuestRuntimeError);
        REQUIRE(message->result->error->exception_type == "ValueError");
        REQUIRE(message->result->variables.size() == 1);
        REQUIRE(message->result->variables_omitted == 2);
    }

    SECTION("Encoded messages are single lines") {
        WorkerResult result;
        result.state = ExecutionState::Completed;
        result.variables.push_back({"s", "str", "line one\nline two", false});
        REQUIRE(EncodeResult(result, kToken).find('\n') == std::string::npos);
    }

    SECTION("Invalid guest UTF-8 is replaced, not thrown") {
        WorkerResult result;
        result.state = ExecutionState::Completed;
        result.variables.push_back({"b", "str", "\xFF", false});
        REQUIRE_NOTHROW(EncodeResult(result, kToken));
    }
}

TEST_CASE("Wire Format - Malformed messages", "[wire]") {
    REQUIRE_FALSE(DecodeControlMessage("not json", kToken).has_value());
    REQUIRE_FALSE(DecodeControlMessage(R"({"event": "progress", "token": "0123456789abcdef0123456789abcdef"})",
                                       kToken).has_value());
    REQUIRE_FALSE(DecodeControlMessage(R"({"state": "Completed", "token": "0123456789abcdef0123456789abcdef"})",
                                       kToken).has_value());
    // A worker may never report a non-terminal state
    REQUIRE_FALSE(DecodeControlMessage(
        R"({"event": "result", "state": "Running", "token": "0123456789abcdef0123456789abcdef"})",
        kToken).has_value());
}

TEST_CASE("Wire Format - Channel token", "[wire][security]") {
    WorkerResult result;
    result.state = ExecutionState::Completed;

    SECTION("Messages without the token are refused") {
        REQUIRE_FALSE(DecodeControlMessage(R"({"event": "result", "state": "Completed"})", kToken).has_value());
        REQUIRE_FALSE(DecodeControlMessage(R"({"event": "ready"})", kToken).has_value());
        REQUIRE_FALSE(DecodeControlMessage(R"(["result"])", kToken).has_value());
    }

    SECTION("Messages with another token are refused") {
        REQUIRE_FALSE(DecodeControlMessage(EncodeResult(result, "guessed"), kToken).has_value());
        REQUIRE_FALSE(DecodeControlMessage(EncodeResult(result, ""), kToken).has_value());
    }

    SECTION("Generated tokens are fresh hex strings") {
        const std::string first = GenerateChannelToken();
        const std::string second = GenerateChannelToken();
        REQUIRE(first.size() == 32);
        REQUIRE(first.find_first_not_of("0123456789abcdef") == std::string::npos);
        REQUIRE(first != second);
    }
}
