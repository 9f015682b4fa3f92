// tests/test_binary_resolver.cpp
#include <gtest/gtest.h>

#include <stdlib.h>
#include <memory>
#include <string>
#include <vector>
#include "binary_resolver.h"
#include "bridge_config.h"
#include "file_digest.h"
#include "test_helpers.h"

using namespace TvBridge;
using TvBridgeTest::TempDir;
using TvBridgeTest::write_script;
using TvBridgeTest::write_text;

namespace {

/**
 * Strategy with a fixed answer that counts how often it was asked
 */
class FixedStrategy : public ResolverStrategy {
public:
    std::optional<fs::path> answer;
    std::string label;
    bool siblings = true;
    mutable int calls = 0;

    FixedStrategy(std::optional<fs::path> a, std::string l)
        : answer(std::move(a)), label(std::move(l)) {}

    std::optional<fs::path> try_resolve() const override {
        ++calls;
        return answer;
    }
    std::string name() const override { return label; }
    bool stage_siblings() const override { return siblings; }
};

std::string current_path_env() {
    const char* p = getenv("PATH");
    return p ? p : "";
}

class BinaryResolverTest : public ::testing::Test {
protected:
    TempDir dir;

    fs::path make_bridge(const std::string& where, const std::string& marker) {
        fs::path bin = dir.path() / where / "adb" / "adb";
        write_script(bin, "echo " + marker);
        return bin;
    }

    std::string prefix() const {
        return (dir.path() / "stage_").string();
    }
};

}  // namespace

TEST_F(BinaryResolverTest, FirstMatchingStrategyWins) {
    fs::path bundled = make_bridge("bundle", "bundled");
    make_bridge("cwd", "cwd");

    std::vector<std::unique_ptr<ResolverStrategy>> chain;
    chain.push_back(std::make_unique<BundledResourceStrategy>((dir.path() / "bundle").string(), "adb", "adb"));
    chain.push_back(std::make_unique<WorkingDirectoryStrategy>(dir.path() / "cwd", "adb", "adb"));
    BinaryResolver resolver(std::move(chain), prefix(), "adb");

    auto result = resolver.resolve();
    ASSERT_TRUE(result.ok()) << result.error().reason;
    EXPECT_EQ(result.location().strategy, "bundled-resources");
    EXPECT_EQ(result.location().source.string(), bundled.string());
    EXPECT_EQ(result.location().binary.filename().string(), "adb");
    EXPECT_EQ(result.location().binary.parent_path().string(), result.location().staging_dir.string());
    EXPECT_EQ(result.location().sha256, sha256_file(bundled.string()));
    EXPECT_EQ(result.location().sha256.size(), 64u);

    resolver.cleanup();
}

TEST_F(BinaryResolverTest, FallsThroughToLaterStrategies) {
    make_bridge("cwd", "cwd");

    std::vector<std::unique_ptr<ResolverStrategy>> chain;
    chain.push_back(std::make_unique<BundledResourceStrategy>((dir.path() / "no-bundle").string(), "adb", "adb"));
    chain.push_back(std::make_unique<PackageLocalStrategy>(dir.path() / "no-exe-dir", "adb", "adb"));
    chain.push_back(std::make_unique<WorkingDirectoryStrategy>(dir.path() / "cwd", "adb", "adb"));
    BinaryResolver resolver(std::move(chain), prefix(), "adb");

    auto result = resolver.resolve();
    ASSERT_TRUE(result.ok()) << result.error().reason;
    EXPECT_EQ(result.location().strategy, "working-directory");
    resolver.cleanup();
}

TEST_F(BinaryResolverTest, SearchPathFindsFirstExecutableEntry) {
    write_text(dir.path() / "a" / "adb", "not executable");
    write_script(dir.path() / "b" / "adb", "echo b");
    write_script(dir.path() / "c" / "adb", "echo c");
    std::string path_env = (dir.path() / "a").string() + ":" + (dir.path() / "b").string() + ":" +
                           (dir.path() / "c").string();

    SearchPathStrategy strategy(path_env, "adb");
    auto found = strategy.try_resolve();
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->string(), (dir.path() / "b" / "adb").string());
    EXPECT_FALSE(strategy.stage_siblings());
}

TEST_F(BinaryResolverTest, FailureListsEveryStrategyTried) {
    std::vector<std::unique_ptr<ResolverStrategy>> chain;
    chain.push_back(std::make_unique<WorkingDirectoryStrategy>(dir.path(), "adb", "adb"));
    chain.push_back(std::make_unique<SearchPathStrategy>(dir.path().string(), "adb"));
    BinaryResolver resolver(std::move(chain), prefix(), "adb");

    auto result = resolver.resolve();
    ASSERT_FALSE(result.ok());
    EXPECT_NE(result.error().reason.find("'adb' not found"), std::string::npos);
    EXPECT_NE(result.error().reason.find("working-directory"), std::string::npos);
    EXPECT_NE(result.error().reason.find("search-path"), std::string::npos);
    EXPECT_FALSE(resolver.cached().has_value());
}

TEST_F(BinaryResolverTest, FailureIsNotCached) {
    auto strategy = std::make_unique<FixedStrategy>(std::nullopt, "fixed");
    FixedStrategy* raw = strategy.get();
    std::vector<std::unique_ptr<ResolverStrategy>> chain;
    chain.push_back(std::move(strategy));
    BinaryResolver resolver(std::move(chain), prefix(), "adb");

    EXPECT_FALSE(resolver.resolve().ok());
    raw->answer = make_bridge("late", "late");
    auto result = resolver.resolve();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(raw->calls, 2);
    resolver.cleanup();
}

TEST_F(BinaryResolverTest, ResolvesOnceUntilCleanup) {
    auto strategy = std::make_unique<FixedStrategy>(make_bridge("x", "x"), "fixed");
    FixedStrategy* raw = strategy.get();
    std::vector<std::unique_ptr<ResolverStrategy>> chain;
    chain.push_back(std::move(strategy));
    BinaryResolver resolver(std::move(chain), prefix(), "adb");

    auto first = resolver.resolve();
    auto second = resolver.resolve();
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.location().staging_dir.string(), second.location().staging_dir.string());
    EXPECT_EQ(raw->calls, 1);

    fs::path staged = first.location().staging_dir;
    EXPECT_TRUE(fs::exists(staged));
    resolver.cleanup();
    EXPECT_FALSE(fs::exists(staged));
    EXPECT_FALSE(resolver.cached().has_value());

    // Second cleanup is a no-op
    resolver.cleanup();

    auto third = resolver.resolve();
    ASSERT_TRUE(third.ok());
    EXPECT_NE(third.location().staging_dir.string(), staged.string());
    EXPECT_EQ(raw->calls, 2);
    resolver.cleanup();
}

TEST_F(BinaryResolverTest, StagesSiblingsForDirectoryCandidates) {
    fs::path bin = make_bridge("tools", "tools");
    write_text(bin.parent_path() / "AdbWinApi.dll", "helper");
    fs::create_directories(bin.parent_path() / "nested");

    std::vector<std::unique_ptr<ResolverStrategy>> chain;
    chain.push_back(std::make_unique<WorkingDirectoryStrategy>(dir.path() / "tools", "adb", "adb"));
    BinaryResolver resolver(std::move(chain), prefix(), "adb");

    auto result = resolver.resolve();
    ASSERT_TRUE(result.ok());
    fs::path staging = result.location().staging_dir;
    EXPECT_TRUE(fs::exists(staging / "AdbWinApi.dll"));
    EXPECT_FALSE(fs::exists(staging / "nested"));
    EXPECT_EQ(staging.string().rfind(prefix(), 0), 0u);
    resolver.cleanup();
}

TEST_F(BinaryResolverTest, SearchPathCandidateStagedAlone) {
    fs::path bin = dir.path() / "bin" / "adb";
    write_script(bin, "echo path");
    write_text(dir.path() / "bin" / "unrelated-tool", "x");

    std::vector<std::unique_ptr<ResolverStrategy>> chain;
    chain.push_back(std::make_unique<SearchPathStrategy>((dir.path() / "bin").string(), "adb"));
    BinaryResolver resolver(std::move(chain), prefix(), "adb");

    auto result = resolver.resolve();
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(is_executable_file(result.location().binary));
    EXPECT_FALSE(fs::exists(result.location().staging_dir / "unrelated-tool"));
    resolver.cleanup();
}

TEST_F(BinaryResolverTest, PrependsStagingDirToPathAndRestores) {
    std::string before = current_path_env();

    std::vector<std::unique_ptr<ResolverStrategy>> chain;
    chain.push_back(std::make_unique<FixedStrategy>(make_bridge("p", "p"), "fixed"));
    BinaryResolver resolver(std::move(chain), prefix(), "adb");

    auto result = resolver.resolve();
    ASSERT_TRUE(result.ok());
    std::string during = current_path_env();
    EXPECT_EQ(during.rfind(result.location().staging_dir.string() + ":", 0), 0u);

    resolver.cleanup();
    EXPECT_EQ(current_path_env(), before);
}

TEST_F(BinaryResolverTest, DestructorCleansUp) {
    fs::path staged;
    {
        std::vector<std::unique_ptr<ResolverStrategy>> chain;
        chain.push_back(std::make_unique<FixedStrategy>(make_bridge("d", "d"), "fixed"));
        BinaryResolver resolver(std::move(chain), prefix(), "adb");
        auto result = resolver.resolve();
        ASSERT_TRUE(result.ok());
        staged = result.location().staging_dir;
    }
    EXPECT_FALSE(fs::exists(staged));
}

TEST(BinaryResolverConfig, StandardChainHasFourStrategies) {
    BridgeConfig config;
    auto resolver = BinaryResolver::from_config(config);
    EXPECT_EQ(resolver->strategy_count(), 4u);
}

TEST(BundledResourceStrategy, EnvironmentVariableSuppliesBundle) {
    TempDir dir;
    write_script(dir.path() / "adb" / "adb", "echo env");

    setenv("TVBRIDGE_BUNDLE_DIR", dir.path().c_str(), 1);
    BundledResourceStrategy strategy("", "adb", "adb");
    auto found = strategy.try_resolve();
    unsetenv("TVBRIDGE_BUNDLE_DIR");

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->string(), (dir.path() / "adb" / "adb").string());

    EXPECT_FALSE(strategy.try_resolve().has_value());
}
