#include <gtest/gtest.h>
#include "utils/config.h"
#include "core/coordinator.h"
#include <filesystem>
#include <fstream>

using namespace warden;
using namespace warden::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "warden_config_test";
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = testDir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path testDir;
};

TEST_F(ConfigTest, DefaultsMatchDocumentedLimits) {
    Config config;
    core::ResourceLimits limits = config.getResourceLimits();
    EXPECT_EQ(limits.maxWallSeconds, 30u);
    EXPECT_EQ(limits.maxMemoryBytes, 512ULL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(limits.maxCpuFraction, 0.5);
    EXPECT_FALSE(limits.networkEnabled);
    EXPECT_EQ(limits.filesystemMode, core::FilesystemMode::NONE);
    EXPECT_EQ(limits.maxOutputBytes, 1024u * 1024u);

    EXPECT_TRUE(config.getBool("guardrails.enabled"));
    EXPECT_FALSE(config.getAuditConfig().logRejectedMessage);
    EXPECT_EQ(config.getSandboxConfig().strategy, "auto");
    EXPECT_EQ(config.getSessionConfig().lockPolicy, "wait");
    EXPECT_EQ(config.getSessionConfig().lockWaitSeconds, 35u);
    EXPECT_TRUE(config.validate().empty());
}

TEST_F(ConfigTest, LoadKeyValueFile) {
    std::string path = writeFile("warden.conf",
        "# limits\n"
        "sandbox.max_wall_seconds = 5\n"
        "sandbox.filesystem_mode=read-only\n"
        "sandbox.strategy=restricted\n"
        "\n"
        "session.lock_policy=reject\n"
        "audit.log_rejected_message=yes\n");

    Config config;
    auto loaded = config.load(path);
    ASSERT_TRUE(loaded.ok()) << loaded.error().message;

    EXPECT_EQ(config.getResourceLimits().maxWallSeconds, 5u);
    EXPECT_EQ(config.getResourceLimits().filesystemMode, core::FilesystemMode::READ_ONLY);
    EXPECT_EQ(config.getSandboxConfig().strategy, "restricted");
    EXPECT_EQ(config.getSessionConfig().lockWaitSeconds, 10u);
    EXPECT_TRUE(config.getAuditConfig().logRejectedMessage);
    EXPECT_TRUE(config.validate().empty());

    core::CoordinatorOptions opts = core::CoordinatorOptions::fromConfig(config);
    EXPECT_EQ(opts.lockPolicy, core::LockPolicy::REJECT);
    EXPECT_TRUE(opts.logRejectedMessage);
    EXPECT_EQ(opts.lockWait.count(), 0);
}

TEST_F(ConfigTest, LoadErrors) {
    Config config;
    auto missing = config.load((testDir / "absent.conf").string());
    ASSERT_TRUE(missing.failed());
    EXPECT_EQ(missing.error().code, ErrorCode::IO_ERROR);

    auto bad = config.load(writeFile("bad.conf", "sandbox.max_wall_seconds 5\n"));
    ASSERT_TRUE(bad.failed());
    EXPECT_EQ(bad.error().code, ErrorCode::PARSE_ERROR);
    EXPECT_NE(bad.error().message.find(":1:"), std::string::npos);
}

TEST_F(ConfigTest, ValidateReportsProblems) {
    Config config;
    config.set("sandbox.max_wall_seconds", 0);
    config.set("sandbox.max_cpu_fraction", "-1");
    config.set("sandbox.strategy", "vm");
    config.set("session.lock_policy", "queue");
    config.set("sandbox.filesystem_mode", "read-write");
    EXPECT_EQ(config.validate().size(), 5u);

    core::ResourceLimits limits = config.getResourceLimits();
    EXPECT_EQ(limits.maxWallSeconds, 30u);
    EXPECT_DOUBLE_EQ(limits.maxCpuFraction, 0.5);
}

TEST_F(ConfigTest, TypedAccessors) {
    Config config;
    config.set("x.int", 42);
    config.set("x.big", static_cast<int64_t>(1) << 40);
    config.set("x.flag", "off");
    config.set("x.list", "a, b,,c");
    config.set("x.junk", "abc");

    EXPECT_EQ(config.getInt("x.int"), 42);
    EXPECT_EQ(config.getInt64("x.big"), static_cast<int64_t>(1) << 40);
    EXPECT_FALSE(config.getBool("x.flag", true));
    config.set("x.upper", "YES");
    config.set("x.accented", "\xC3\x89t\xC3\xA9");
    EXPECT_TRUE(config.getBool("x.upper", false));
    EXPECT_TRUE(config.getBool("x.accented", true));
    EXPECT_EQ(config.getList("x.list"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(config.getInt("x.junk", 7), 7);
    EXPECT_EQ(config.getString("x.none", "fallback"), "fallback");

    config.remove("x.int");
    EXPECT_FALSE(config.has("x.int"));
    EXPECT_EQ(config.keys("x.").size(), 4u);
}

TEST_F(ConfigTest, SaveAndReload) {
    Config config;
    config.set("sandbox.container_image", "analysis:1.2");
    std::string path = (testDir / "saved.conf").string();
    ASSERT_TRUE(config.save(path));

    Config reloaded;
    ASSERT_TRUE(reloaded.load(path).ok());
    EXPECT_EQ(reloaded.getSandboxConfig().containerImage, "analysis:1.2");
    EXPECT_EQ(reloaded.size(), config.size());
}

TEST_F(ConfigTest, ExplicitLockWaitOverridesDefault) {
    Config config;
    config.set("session.lock_wait_seconds", 2);
    core::CoordinatorOptions opts = core::CoordinatorOptions::fromConfig(config);
    EXPECT_EQ(opts.lockWait, std::chrono::milliseconds(2000));
}
