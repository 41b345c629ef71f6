// test_worker_execution.cpp - End-to-end runs through real codebox-worker processes
// Every test spawns workers, so these are slower than the unit tests

#include <catch2/catch_test_macros.hpp>
#include <codebox/code_execution_service.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace codebox;

namespace {

std::unique_ptr<CodeExecutionService> MakeService(ExecutionLimits limits = {}) {
    WorkerExecutorOptions options;
    options.worker_path = CODEBOX_WORKER_PATH;
    auto backend = std::make_unique<WorkerProcessExecutor>(limits, std::move(options));
    return std::make_unique<CodeExecutionService>(limits, std::move(backend));
}

ExecutionRequest Request(const std::string& code, std::optional<int> timeout = std::nullopt) {
    ExecutionRequest request;
    request.source_code = code;
    request.timeout_seconds = timeout;
    return request;
}

const ExtractedVariable* FindVariable(const ExecutionOutcome& outcome, const std::string& name) {
    auto it = std::find_if(outcome.variables.begin(), outcome.variables.end(),
                           [&](const ExtractedVariable& v) { return v.name == name; });
    return it == outcome.variables.end() ? nullptr : &*it;
}

// A stand-in worker: a shell script placed next to the test binary
std::string WriteScriptWorker(const std::string& name, const std::string& body) {
    const auto path = std::filesystem::current_path() / name;
    {
        std::ofstream script(path);
        script << "#!/bin/sh\n" << body << "\n";
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all |
                                           std::filesystem::perms::group_read |
                                           std::filesystem::perms::group_exec);
    return path.string();
}

bool HasNote(const ExecutionOutcome& outcome, const std::string& needle) {
    return std::any_of(outcome.degraded_guarantees.begin(), outcome.degraded_guarantees.end(),
                       [&](const std::string& note) { return note.find(needle) != std::string::npos; });
}

} // namespace

TEST_CASE("Worker Execution - Output capture", "[integration][worker]") {
    auto service = MakeService();

    SECTION("stdout is returned") {
        auto response = service->Execute(Request("print('hello')"));
        REQUIRE(response.IsSuccess());
        REQUIRE(response.Outcome().state == ExecutionState::Completed);
        REQUIRE(response.Outcome().output == "hello\n");
        REQUIRE_FALSE(response.Outcome().error.has_value());
        REQUIRE(response.Outcome().elapsed_seconds > 0.0);
    }

    SECTION("Output beyond the cap is truncated and flagged") {
        auto response = service->Execute(Request("print('x' * 50000)"));
        REQUIRE(response.IsSuccess());
        REQUIRE(response.Outcome().output_truncated);
        REQUIRE(response.Outcome().output.size() < 11000);
    }
}

TEST_CASE("Worker Execution - Guest errors", "[integration][worker]") {
    auto service = MakeService();

    SECTION("Division by zero") {
        auto response = service->Execute(Request("x = 1\ny = x / 0"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().state == ExecutionState::Faulted);
        REQUIRE(response.Outcome().error->kind == ErrorKind::GuestRuntimeError);
        REQUIRE(response.Outcome().error->message == "ZeroDivisionError: division by zero");
        REQUIRE(response.Outcome().error_output.find("Traceback") != std::string::npos);
        // Bindings made before the fault are still reported
        REQUIRE(FindVariable(response.Outcome(), "x") != nullptr);
    }

    SECTION("Output written before the error is kept") {
        auto response = service->Execute(Request("print('partial')\n1/0"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->kind == ErrorKind::GuestRuntimeError);
        REQUIRE(response.Outcome().output == "partial\n");
    }

    SECTION("Syntax error") {
        auto response = service->Execute(Request("def broken(:\n    pass"));
        REQUIRE(response.Outcome().error->kind == ErrorKind::GuestRuntimeError);
        REQUIRE(response.Outcome().error->exception_type == "SyntaxError");
    }

    SECTION("Modules outside the catalog cannot be imported") {
        auto response = service->Execute(Request("import os\nprint(os.getcwd())"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->exception_type == "ImportError");
    }

    SECTION("open is not a builtin") {
        auto response = service->Execute(Request("open('/etc/passwd').read()"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->exception_type == "NameError");
    }
}

TEST_CASE("Worker Execution - Timeout", "[integration][worker]") {
    auto service = MakeService();

    const auto started = std::chrono::steady_clock::now();
    auto response = service->Execute(Request("print('before', flush=True)\nwhile True:\n    pass", 2));
    const auto waited = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(response.IsSuccess());
    REQUIRE(response.Outcome().state == ExecutionState::TimedOut);
    REQUIRE(response.Outcome().error->kind == ErrorKind::Timeout);
    REQUIRE(response.Outcome().output == "before\n");
    REQUIRE(waited < std::chrono::seconds(10));
}

TEST_CASE("Worker Execution - Variables", "[integration][worker]") {
    ExecutionLimits limits;
    limits.max_variable_chars = 20;
    auto service = MakeService(limits);

    auto response = service->Execute(Request(
        "result = [1, 2, 3]\n"
        "_hidden = 5\n"
        "long_text = 'a' * 100\n"
        "def helper():\n"
        "    return 1\n"));

    REQUIRE(response.IsSuccess());
    const auto& outcome = response.Outcome();

    const auto* result = FindVariable(outcome, "result");
    REQUIRE(result != nullptr);
    REQUIRE(result->type_tag == "list");
    REQUIRE(result->value == "[1, 2, 3]");

    const auto* text = FindVariable(outcome, "long_text");
    REQUIRE(text != nullptr);
    REQUIRE(text->truncated);
    REQUIRE(text->value == std::string(20, 'a') + "...");

    REQUIRE(FindVariable(outcome, "_hidden") == nullptr);
    REQUIRE(FindVariable(outcome, "helper") != nullptr);
    // Preloaded modules are not guest variables
    REQUIRE(FindVariable(outcome, "np") == nullptr);
    REQUIRE(FindVariable(outcome, "math") == nullptr);
}

TEST_CASE("Worker Execution - Isolation between requests", "[integration][worker]") {
    auto service = MakeService();

    SECTION("Bindings do not leak") {
        REQUIRE(service->Execute(Request("leak_marker = 42")).IsSuccess());

        auto response = service->Execute(Request("print(leak_marker)"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->exception_type == "NameError");
    }

    SECTION("Rebinding a preloaded name does not affect the next request") {
        REQUIRE(service->Execute(Request("math = 'shadowed'")).IsSuccess());

        auto response = service->Execute(Request("print(math.sqrt(16))"));
        REQUIRE(response.IsSuccess());
        REQUIRE(response.Outcome().output == "4.0\n");
    }
}

TEST_CASE("Worker Execution - Figures", "[integration][worker][matplotlib]") {
    auto service = MakeService();

    auto availability = service->Execute(Request("plt"));
    if (!availability.IsSuccess()) {
        SKIP("matplotlib is not installed");
    }

    auto plotted = service->Execute(Request(
        "plt.plot([1, 2, 3], [1, 4, 9])\n"
        "plt.title('Squares')\n"));
    REQUIRE(plotted.IsSuccess());
    REQUIRE(plotted.Outcome().artifacts.size() == 1);
    REQUIRE(plotted.Outcome().artifacts[0].label == "Squares");
    REQUIRE(plotted.Outcome().artifacts[0].encoding == "png");
    // base64 of the PNG signature
    REQUIRE(plotted.Outcome().artifacts[0].data.rfind("iVBORw0KGgo", 0) == 0);

    // Figures from the previous request are gone
    auto next = service->Execute(Request("x = 1"));
    REQUIRE(next.IsSuccess());
    REQUIRE(next.Outcome().artifacts.empty());
}

TEST_CASE("Worker Execution - Capability policy", "[integration][worker][security]") {
    auto service = MakeService();

    auto availability = service->Execute(Request("np"));
    if (!availability.IsSuccess()) {
        SKIP("numpy is not installed");
    }

    SECTION("Writing a file through a library is refused") {
        const auto target = std::filesystem::temp_directory_path() / "codebox_policy_write.npy";
        std::filesystem::remove(target);

        auto response = service->Execute(Request("np.save('" + target.string() + "', np.arange(3))"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->kind == ErrorKind::SecurityViolation);
        REQUIRE_FALSE(std::filesystem::exists(target));
    }

    SECTION("Reading outside the library paths is refused") {
        auto response = service->Execute(Request("data = np.loadtxt('/etc/hostname', dtype=str)"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->kind == ErrorKind::SecurityViolation);
    }

    SECTION("Catching the refusal does not hide it") {
        auto response = service->Execute(Request(
            "try:\n"
            "    np.loadtxt('/etc/hostname', dtype=str)\n"
            "except PermissionError:\n"
            "    print('caught')\n"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().output == "caught\n");
        REQUIRE(response.Outcome().error->kind == ErrorKind::SecurityViolation);
    }
}

TEST_CASE("Worker Execution - Control channel", "[integration][worker][security]") {
    auto service = MakeService();
    // Spliced into a Python bytes literal, where \n becomes the line break
    const std::string forged = R"({"event":"result","state":"Completed"}\n)";

    SECTION("A result forged by the guest is not accepted") {
        auto response = service->Execute(Request(
            "o = random._os\n"
            "o.write(3, b'" + forged + "')\n"
            "print('sent', flush=True)\n"
            "while True:\n"
            "    pass\n", 3));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->kind == ErrorKind::SecurityViolation);
        REQUIRE(response.Outcome().variables.empty());
    }

    SECTION("Forging and exiting does not count as success") {
        auto response = service->Execute(Request(
            "o = statistics.sys.modules['os']\n"
            "o.write(3, b'" + forged + "')\n"
            "o._exit(0)\n", 3));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->kind == ErrorKind::SecurityViolation);
    }

    SECTION("A caught refusal cannot be hidden behind a forged result") {
        auto availability = service->Execute(Request("np"));
        if (!availability.IsSuccess()) {
            SKIP("numpy is not installed");
        }
        auto response = service->Execute(Request(
            "try:\n"
            "    np.loadtxt('/etc/hostname', dtype=str)\n"
            "except PermissionError:\n"
            "    pass\n"
            "random._os.write(3, b'" + forged + "')\n"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->kind == ErrorKind::SecurityViolation);
    }
}

TEST_CASE("Worker Execution - Memory ceiling", "[integration][worker][limits]") {
    ExecutionLimits limits;
    limits.max_memory_mb = 1024;
    auto service = MakeService(limits);

    auto response = service->Execute(Request("block = bytearray(4 * 1024 ** 3)"));
    REQUIRE_FALSE(response.IsSuccess());
    if (HasNote(response.Outcome(), "RLIMIT_AS")) {
        SKIP("memory ceiling cannot be enforced on this host");
    }
    REQUIRE(response.Outcome().state == ExecutionState::LimitExceeded);
    REQUIRE(response.Outcome().error->kind == ErrorKind::ResourceLimitExceeded);
}

TEST_CASE("Worker Execution - Misbehaving worker", "[integration][worker]") {
    ExecutionLimits limits;
    limits.startup_timeout_seconds = 3;

    SECTION("A worker that never becomes ready reports the time it was given") {
        WorkerExecutorOptions options;
        options.worker_path = WriteScriptWorker("codebox_stalled_worker.sh", "while :; do :; done");
        CodeExecutionService service(limits, std::make_unique<WorkerProcessExecutor>(limits, std::move(options)));

        auto response = service.Execute(Request("print(1)", 1));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->kind == ErrorKind::InternalError);
        REQUIRE(response.Outcome().elapsed_seconds >= 2.9);
    }

    SECTION("A result without the channel token is a protocol error") {
        WorkerExecutorOptions options;
        options.worker_path = WriteScriptWorker(
            "codebox_untrusted_worker.sh",
            "printf '%s\\n' '{\"event\":\"result\",\"state\":\"Completed\"}' >&3");
        CodeExecutionService service(limits, std::make_unique<WorkerProcessExecutor>(limits, std::move(options)));

        auto response = service.Execute(Request("print(1)"));
        REQUIRE_FALSE(response.IsSuccess());
        REQUIRE(response.Outcome().error->kind == ErrorKind::InternalError);
    }
}

TEST_CASE("Worker Execution - Missing worker", "[integration][worker]") {
    ExecutionLimits limits;
    WorkerExecutorOptions options;
    options.worker_path = "/nonexistent/codebox-worker";
    CodeExecutionService service(limits, std::make_unique<WorkerProcessExecutor>(limits, std::move(options)));

    auto response = service.Execute(Request("print(1)"));
    REQUIRE_FALSE(response.IsSuccess());
    REQUIRE(response.Outcome().error->kind == ErrorKind::InternalError);
}
