// test_capability_policy.cpp - Unit tests for audit hook decisions

#include <catch2/catch_test_macros.hpp>
#include "scripting/capability_policy.h"

#include <fcntl.h>

using namespace codebox::scripting;

TEST_CASE("Capability Policy - Denied events", "[policy]") {
    SECTION("Process creation and network") {
        REQUIRE(CapabilityPolicy::IsDeniedEvent("os.system"));
        REQUIRE(CapabilityPolicy::IsDeniedEvent("os.exec"));
        REQUIRE(CapabilityPolicy::IsDeniedEvent("subprocess.Popen"));
        REQUIRE(CapabilityPolicy::IsDeniedEvent("socket.connect"));
        REQUIRE(CapabilityPolicy::IsDeniedEvent("urllib.Request"));
    }

    SECTION("Native code and filesystem mutation") {
        REQUIRE(CapabilityPolicy::IsDeniedEvent("ctypes.dlopen"));
        REQUIRE(CapabilityPolicy::IsDeniedEvent("os.remove"));
        REQUIRE(CapabilityPolicy::IsDeniedEvent("shutil.rmtree"));
        REQUIRE(CapabilityPolicy::IsDeniedEvent("resource.setrlimit"));
    }

    SECTION("Ordinary interpreter events pass") {
        REQUIRE_FALSE(CapabilityPolicy::IsDeniedEvent("import"));
        REQUIRE_FALSE(CapabilityPolicy::IsDeniedEvent("exec"));
        REQUIRE_FALSE(CapabilityPolicy::IsDeniedEvent("compile"));
        REQUIRE_FALSE(CapabilityPolicy::IsDeniedEvent("open"));
    }
}

TEST_CASE("Capability Policy - Open modes", "[policy]") {
    REQUIRE_FALSE(CapabilityPolicy::IsWriteOpen("r", O_RDONLY));
    REQUIRE_FALSE(CapabilityPolicy::IsWriteOpen("rb", O_RDONLY | O_CLOEXEC));
    REQUIRE(CapabilityPolicy::IsWriteOpen("w", 0));
    REQUIRE(CapabilityPolicy::IsWriteOpen("a", 0));
    REQUIRE(CapabilityPolicy::IsWriteOpen("r+", 0));
    REQUIRE(CapabilityPolicy::IsWriteOpen("x", 0));
    REQUIRE(CapabilityPolicy::IsWriteOpen("", O_WRONLY | O_CREAT));
    REQUIRE(CapabilityPolicy::IsWriteOpen("", O_RDWR));
}

TEST_CASE("Capability Policy - Read roots", "[policy]") {
    auto& policy = CapabilityPolicy::Instance();
    policy.SetReadRoots({"/usr/lib/python3", "/usr/share/zoneinfo"});

    REQUIRE(policy.IsReadablePath("/usr/lib/python3/json/__init__.py"));
    REQUIRE(policy.IsReadablePath("/usr/share/zoneinfo/UTC"));
    REQUIRE_FALSE(policy.IsReadablePath("/etc/passwd"));
    REQUIRE_FALSE(policy.IsReadablePath(""));

    SECTION("Sibling directories sharing a prefix are outside") {
        REQUIRE_FALSE(policy.IsReadablePath("/usr/lib/python3-secrets/key"));
    }

    SECTION("Traversal is normalised before the check") {
        REQUIRE_FALSE(policy.IsReadablePath("/usr/share/zoneinfo/../../../etc/passwd"));
    }

    policy.SetReadRoots({});
}
