#include <gtest/gtest.h>
#include "sandbox/restricted_sandbox.h"
#include "sandbox/sandbox_factory.h"
#include "guard/audit_log.h"
#include "utils/logger.h"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace warden;
using namespace warden::sandbox;

class RestrictedSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger.enableConsole(false);
        policy = std::make_shared<const policy::PolicyStore>(policy::PolicyStore::defaults());
        config.strategy = "restricted";
        sandbox = std::make_unique<RestrictedInterpreterSandbox>(policy, ctx, config);
    }

    void requirePython() {
        if (!sandbox->probe()) {
            GTEST_SKIP() << "python3 not available";
        }
    }

    core::ResourceLimits limits(uint32_t wallSeconds = 10) const {
        core::ResourceLimits l;
        l.maxWallSeconds = wallSeconds;
        return l;
    }

    utils::Logger logger;
    guard::AuditLog audit;
    core::Context ctx{logger, audit};
    policy::PolicyStorePtr policy;
    utils::SandboxConfig config;
    std::unique_ptr<RestrictedInterpreterSandbox> sandbox;
};

TEST_F(RestrictedSandboxTest, UnavailableBeforeProbe) {
    EXPECT_FALSE(sandbox->isAvailable());
    core::ExecutionResult r = sandbox->execute("print(1)", core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::SANDBOX_UNAVAILABLE);
    EXPECT_EQ(r.strategy, core::SandboxStrategy::RESTRICTED_INTERPRETER);
}

TEST_F(RestrictedSandboxTest, MissingInterpreterFailsProbe) {
    utils::SandboxConfig missing = config;
    missing.pythonPath = "/nonexistent/bin/python3";
    RestrictedInterpreterSandbox broken(policy, ctx, missing);
    EXPECT_FALSE(broken.probe());
    EXPECT_FALSE(broken.isAvailable());
}

TEST_F(RestrictedSandboxTest, PrintsOutput) {
    requirePython();
    core::ExecutionResult r = sandbox->execute("total = sum(range(4))\nprint(total)", core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::OK) << r.errorMessage;
    EXPECT_EQ(r.stdoutText, "6\n");
    EXPECT_EQ(r.strategy, core::SandboxStrategy::RESTRICTED_INTERPRETER);
}

TEST_F(RestrictedSandboxTest, ReceivesDataContext) {
    requirePython();
    core::DataContext data;
    data.name = "orders.csv";
    data.csv = "id,amount\n1,10\n2,20\n3,30\n";
    data.metadata["owner"] = "finance";
    core::ExecutionResult r = sandbox->execute(
        "print(len(rows), data_name, metadata['owner'])", data, limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::OK) << r.errorMessage;
    EXPECT_EQ(r.stdoutText, "3 orders.csv finance\n");
}

TEST_F(RestrictedSandboxTest, InfiniteLoopTimesOut) {
    requirePython();
    auto start = std::chrono::steady_clock::now();
    core::ExecutionResult r = sandbox->execute("while True:\n    pass\n", core::DataContext(), limits(5));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_EQ(r.status, core::ExecutionStatus::TIMEOUT);
    EXPECT_TRUE(r.stdoutText.empty());
    EXPECT_GE(elapsed.count(), 5000);
    EXPECT_LE(elapsed.count(), 5000 + 1000);
}

TEST_F(RestrictedSandboxTest, RepeatedRunsAgree) {
    requirePython();
    core::DataContext data;
    data.name = "orders.csv";
    data.csv = "id,amount\n1,10\n2,25\n3,40\n";
    const std::string code =
        "amounts = [int(r['amount']) for r in rows]\n"
        "print(len(amounts), sum(amounts), statistics.mean(amounts))\n";

    core::ExecutionResult first = sandbox->execute(code, data, limits());
    core::ExecutionResult second = sandbox->execute(code, data, limits());
    EXPECT_EQ(first.status, core::ExecutionStatus::OK) << first.errorMessage;
    EXPECT_EQ(first.status, second.status);
    EXPECT_EQ(first.stdoutText, second.stdoutText);
    EXPECT_EQ(first.stdoutText, "3 75 25\n");
}

TEST_F(RestrictedSandboxTest, PreloadedModulesHidePrivateAttributes) {
    requirePython();
    core::ExecutionResult r = sandbox->execute(
        "print(statistics.random._os.popen('id').read())", core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("AttributeError"), std::string::npos);
    EXPECT_EQ(r.stdoutText.find("uid="), std::string::npos);

    r = sandbox->execute("print(statistics.sys.modules)", core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("not permitted"), std::string::npos);

    r = sandbox->execute("import random\nprint(random._inst)", core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("AttributeError"), std::string::npos);

    r = sandbox->execute("import math\nprint(math.floor(2.5), repr(math))", core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::OK) << r.errorMessage;
    EXPECT_EQ(r.stdoutText, "2 <module 'math'>\n");
}

TEST_F(RestrictedSandboxTest, ProcessControlDeniedAtRuntime) {
    requirePython();
    // Function globals still hold real modules; the interpreter hook stops them.
    core::ExecutionResult r = sandbox->execute(
        "host = statistics.mean.__globals__['random']._os\nprint(host.popen('id').read())",
        core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("PermissionError"), std::string::npos);
    EXPECT_EQ(r.stdoutText.find("uid="), std::string::npos);

    r = sandbox->execute(
        "host = statistics.mean.__globals__['random']._os\nhost.system('true')\nprint('ran')",
        core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_EQ(r.stdoutText.find("ran"), std::string::npos);
}

class RestrictedFilesystemTest : public RestrictedSandboxTest {
protected:
    void SetUp() override {
        RestrictedSandboxTest::SetUp();
        hostFile = std::filesystem::temp_directory_path() / "warden_fs_host.txt";
        std::ofstream(hostFile) << "host secret";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(hostFile, ec);
        std::filesystem::remove(hostFile.string() + ".out", ec);
    }

    core::ResourceLimits fsLimits(core::FilesystemMode mode) const {
        core::ResourceLimits l = limits();
        l.filesystemMode = mode;
        return l;
    }

    std::filesystem::path hostFile;
};

TEST_F(RestrictedFilesystemTest, NoneRefusesHostReads) {
    requirePython();
    core::ExecutionResult r = sandbox->execute(
        "import io\nprint(io.open('" + hostFile.string() + "').read())",
        core::DataContext(), fsLimits(core::FilesystemMode::NONE));
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("PermissionError"), std::string::npos);
    EXPECT_EQ(r.stdoutText.find("host secret"), std::string::npos);
}

TEST_F(RestrictedFilesystemTest, NoneRefusesScratchWrites) {
    requirePython();
    core::ExecutionResult r = sandbox->execute(
        "import io\nio.open('out.txt', 'w').write('x')\nprint('wrote')",
        core::DataContext(), fsLimits(core::FilesystemMode::NONE));
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("PermissionError"), std::string::npos);
}

TEST_F(RestrictedFilesystemTest, ReadOnlyAllowsHostReads) {
    requirePython();
    core::ExecutionResult r = sandbox->execute(
        "import io\nprint(io.open('" + hostFile.string() + "').read())",
        core::DataContext(), fsLimits(core::FilesystemMode::READ_ONLY));
    EXPECT_EQ(r.status, core::ExecutionStatus::OK) << r.errorMessage;
    EXPECT_EQ(r.stdoutText, "host secret\n");
}

TEST_F(RestrictedFilesystemTest, ReadOnlyConfinesWritesToScratch) {
    requirePython();
    core::ExecutionResult r = sandbox->execute(
        "import io\nio.open('" + hostFile.string() + ".out', 'w').write('x')",
        core::DataContext(), fsLimits(core::FilesystemMode::READ_ONLY));
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("PermissionError"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(hostFile.string() + ".out"));

    r = sandbox->execute(
        "import io\n"
        "with io.open('notes.txt', 'w') as f:\n"
        "    f.write('draft')\n"
        "print(io.open('notes.txt').read())\n",
        core::DataContext(), fsLimits(core::FilesystemMode::READ_ONLY));
    EXPECT_EQ(r.status, core::ExecutionStatus::OK) << r.errorMessage;
    EXPECT_EQ(r.stdoutText, "draft\n");
}

TEST_F(RestrictedSandboxTest, RuntimeErrorIsScrubbed) {
    requirePython();
    core::ExecutionResult r = sandbox->execute("print('before')\nx = 1 / 0", core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("ZeroDivisionError"), std::string::npos);
    EXPECT_EQ(r.errorMessage.find("/usr/"), std::string::npos);
    EXPECT_EQ(r.errorMessage.find('\n'), std::string::npos);
}

TEST_F(RestrictedSandboxTest, ImportsOutsidePolicyFail) {
    requirePython();
    core::ExecutionResult r = sandbox->execute("import socket\nprint('connected')", core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("ImportError"), std::string::npos);
    EXPECT_EQ(r.stdoutText.find("connected"), std::string::npos);
}

TEST_F(RestrictedSandboxTest, BuiltinsAreRestricted) {
    requirePython();
    core::ExecutionResult r = sandbox->execute("open('x.txt')", core::DataContext(), limits());
    EXPECT_EQ(r.status, core::ExecutionStatus::RUNTIME_ERROR);
    EXPECT_NE(r.errorMessage.find("NameError"), std::string::npos);
}

TEST_F(RestrictedSandboxTest, MemoryLimit) {
    requirePython();
    core::ResourceLimits l = limits();
    l.maxMemoryBytes = 256ULL * 1024 * 1024;
    core::ExecutionResult r = sandbox->execute("blob = 'a' * (2 * 1024 ** 3)\nprint(len(blob))", core::DataContext(), l);
    EXPECT_EQ(r.status, core::ExecutionStatus::RESOURCE_EXCEEDED);
}

TEST_F(RestrictedSandboxTest, OutputLimit) {
    requirePython();
    core::ResourceLimits l = limits();
    l.maxOutputBytes = 1024;
    core::ExecutionResult r = sandbox->execute("print('x' * 5000)", core::DataContext(), l);
    EXPECT_EQ(r.status, core::ExecutionStatus::RESOURCE_EXCEEDED);
    EXPECT_TRUE(r.stdoutText.empty());
}

TEST_F(RestrictedSandboxTest, CancellationKillsRun) {
    requirePython();
    core::CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        token.cancel();
    });
    core::ExecutionResult r = sandbox->execute("while True:\n    pass\n", core::DataContext(), limits(20), &token);
    canceller.join();
    EXPECT_EQ(r.status, core::ExecutionStatus::CANCELLED);
}

TEST_F(RestrictedSandboxTest, FactoryPinsRestrictedStrategy) {
    auto created = SandboxFactory::create(policy, ctx, config);
    ASSERT_NE(created, nullptr);
    if (created->isAvailable()) {
        EXPECT_EQ(created->strategy(), core::SandboxStrategy::RESTRICTED_INTERPRETER);
    } else {
        EXPECT_EQ(created->strategy(), core::SandboxStrategy::UNAVAILABLE);
    }

    utils::SandboxConfig unknown = config;
    unknown.strategy = "vm";
    auto none = SandboxFactory::create(policy, ctx, unknown);
    EXPECT_FALSE(none->isAvailable());
    EXPECT_EQ(none->execute("print(1)", core::DataContext(), limits()).status,
              core::ExecutionStatus::SANDBOX_UNAVAILABLE);
}
