// test_code_execution_service.cpp - Pipeline tests against a scripted backend

#include <catch2/catch_test_macros.hpp>
#include <codebox/code_execution_service.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace codebox;

namespace {

// Returns a fixed outcome and counts how often it was asked to run
class ScriptedBackend : public ExecutionBackend {
public:
    ScriptedBackend(std::atomic<int>& calls, ExecutionOutcome outcome, bool throws = false)
        : calls_(calls), outcome_(std::move(outcome)), throws_(throws) {}

    ExecutionOutcome Run(const ExecutionRequest& request, int timeout_seconds) override {
        calls_++;
        last_timeout_ = timeout_seconds;
        (void)request;
        if (throws_) {
            throw std::runtime_error("worker exploded");
        }
        return outcome_;
    }

    std::string GetName() const override { return "scripted"; }

    int LastTimeout() const { return last_timeout_; }

private:
    std::atomic<int>& calls_;
    ExecutionOutcome outcome_;
    bool throws_;
    std::atomic<int> last_timeout_{0};
};

// Takes a while to answer, so callers can act while a run is in flight
class SlowBackend : public ExecutionBackend {
public:
    SlowBackend(std::atomic<int>& calls, std::chrono::milliseconds delay) : calls_(calls), delay_(delay) {}

    ExecutionOutcome Run(const ExecutionRequest&, int) override {
        std::this_thread::sleep_for(delay_);
        calls_++;
        ExecutionOutcome outcome;
        outcome.success = true;
        outcome.state = ExecutionState::Completed;
        return outcome;
    }

    std::string GetName() const override { return "slow"; }

private:
    std::atomic<int>& calls_;
    std::chrono::milliseconds delay_;
};

ExecutionOutcome Completed(const std::string& output) {
    ExecutionOutcome outcome;
    outcome.success = true;
    outcome.state = ExecutionState::Completed;
    outcome.output = output;
    outcome.elapsed_seconds = 0.2;
    return outcome;
}

ExecutionRequest Request(const std::string& code, std::optional<int> timeout = std::nullopt) {
    ExecutionRequest request;
    request.source_code = code;
    request.timeout_seconds = timeout;
    return request;
}

} // namespace

TEST_CASE("Code Execution Service - Rejections never reach the backend", "[service]") {
    std::atomic<int> calls{0};
    ExecutionLimits limits;
    limits.max_source_lines = 3;
    CodeExecutionService service(limits, std::make_unique<ScriptedBackend>(calls, Completed("")));

    SECTION("Oversized source") {
        auto response = service.Execute(Request("a=1\nb=2\nc=3\nd=4"));
        REQUIRE(response.IsRejected());
        REQUIRE(response.Rejection().kind == ErrorKind::RejectedRequest);
        REQUIRE(response.summary.find("Code Execution Rejected") != std::string::npos);
    }

    SECTION("Fast-reject pattern") {
        auto response = service.Execute(Request("x = f.__globals__"));
        REQUIRE(response.IsRejected());
        REQUIRE(response.Rejection().kind == ErrorKind::SecurityViolation);
    }

    SECTION("Unsupported language") {
        auto request = Request("puts 1");
        request.guest_language = "ruby";
        REQUIRE(service.Execute(request).IsRejected());
    }

    REQUIRE(calls == 0);
    REQUIRE(service.GetTelemetry().GetSnapshot().rejections == 1);
}

TEST_CASE("Code Execution Service - Successful execution", "[service]") {
    std::atomic<int> calls{0};
    ExecutionLimits limits;
    auto backend = std::make_unique<ScriptedBackend>(calls, Completed("42\n"));
    auto* scripted = backend.get();
    CodeExecutionService service(limits, std::move(backend));

    auto response = service.Execute(Request("import numpy as np\nprint(42)", 90));

    REQUIRE(calls == 1);
    REQUIRE(response.IsSuccess());
    REQUIRE(scripted->LastTimeout() == limits.max_timeout_seconds);
    REQUIRE(response.Outcome().timeout_seconds == limits.max_timeout_seconds);
    REQUIRE(response.Outcome().referenced_modules.size() == 1);
    REQUIRE(response.Outcome().referenced_modules[0].module == "numpy");
    REQUIRE(response.warnings.size() == 1);
    REQUIRE(response.structured["warnings"].size() == 1);
    REQUIRE(response.summary.find("42") != std::string::npos);
    REQUIRE(service.GetTelemetry().GetSnapshot().successes == 1);
}

TEST_CASE("Code Execution Service - Outcome invariants", "[service]") {
    std::atomic<int> calls{0};
    ExecutionLimits limits;

    SECTION("A failure without an error gains one") {
        ExecutionOutcome broken;
        broken.state = ExecutionState::Completed;
        CodeExecutionService service(limits, std::make_unique<ScriptedBackend>(calls, broken));

        auto response = service.Execute(Request("x = 1"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().state == ExecutionState::Faulted);
        REQUIRE(response.Outcome().error.has_value());
        REQUIRE(response.Outcome().error->kind == ErrorKind::InternalError);
    }

    SECTION("Success with an error is not a success") {
        auto outcome = Completed("");
        outcome.error = ExecutionError{ErrorKind::GuestRuntimeError, "late", ""};
        CodeExecutionService service(limits, std::make_unique<ScriptedBackend>(calls, outcome));

        REQUIRE_FALSE(service.Execute(Request("x = 1")).IsSuccess());
    }

    SECTION("Degraded flag follows the guarantee list") {
        auto outcome = Completed("");
        outcome.degraded_guarantees.push_back("memory ceiling not enforced");
        CodeExecutionService service(limits, std::make_unique<ScriptedBackend>(calls, outcome));

        auto response = service.Execute(Request("x = 1"));
        REQUIRE(response.Outcome().degraded);
        REQUIRE(response.structured["degraded"] == true);
    }

    SECTION("A throwing backend becomes an internal error") {
        CodeExecutionService service(limits, std::make_unique<ScriptedBackend>(calls, Completed(""), true));

        auto response = service.Execute(Request("x = 1"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->kind == ErrorKind::InternalError);
        REQUIRE(service.GetTelemetry().GetSnapshot().internal_errors == 1);
    }
}

TEST_CASE("Code Execution Service - Construction", "[service]") {
    REQUIRE_THROWS_AS(CodeExecutionService(ExecutionLimits{}, nullptr), std::invalid_argument);
}

TEST_CASE("Code Execution Service - Concurrent requests", "[service][concurrency]") {
    std::atomic<int> calls{0};
    CodeExecutionService service(ExecutionLimits{}, std::make_unique<ScriptedBackend>(calls, Completed("ok")));

    std::vector<std::future<ExecutionResponse>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(service.ExecuteAsync(Request("print('ok')")));
    }
    for (auto& future : futures) {
        REQUIRE(future.get().IsSuccess());
    }

    REQUIRE(calls == 8);
    REQUIRE(service.GetTelemetry().GetSnapshot().successes == 8);
}

TEST_CASE("Code Execution Service - Destruction waits for async requests", "[service][concurrency]") {
    std::atomic<int> calls{0};
    auto service = std::make_unique<CodeExecutionService>(
        ExecutionLimits{}, std::make_unique<SlowBackend>(calls, std::chrono::milliseconds(200)));

    auto future = service->ExecuteAsync(Request("print('ok')"));
    service.reset();

    // The backend finished before the service went away
    REQUIRE(calls == 1);
    REQUIRE(future.get().IsSuccess());
}
