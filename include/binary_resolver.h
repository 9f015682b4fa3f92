// include/binary_resolver.h
// Locates the bridge executable and stages it into a private directory

#ifndef BINARY_RESOLVER_H
#define BINARY_RESOLVER_H

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace TvBridge {

namespace fs = std::filesystem;

class BridgeConfig;

/**
 * Resolved, staged bridge binary. The staging directory is owned by the
 * BinaryResolver that produced it.
 */
struct BinaryLocation {
    fs::path binary;
    fs::path staging_dir;
    fs::path source;
    std::string strategy;
    std::string sha256;
};

struct ResolutionError {
    std::string reason;
};

class ResolveResult {
private:
    std::variant<BinaryLocation, ResolutionError> value_;

public:
    ResolveResult(BinaryLocation location) : value_(std::move(location)) {}
    ResolveResult(ResolutionError error) : value_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<BinaryLocation>(value_); }
    const BinaryLocation& location() const { return std::get<BinaryLocation>(value_); }
    const ResolutionError& error() const { return std::get<ResolutionError>(value_); }
};

/**
 * One candidate location for the bridge binary.
 */
class ResolverStrategy {
public:
    virtual ~ResolverStrategy() = default;

    // Path to an executable candidate, or nothing if this location has none
    virtual std::optional<fs::path> try_resolve() const = 0;

    virtual std::string name() const = 0;

    // Copy the candidate's sibling files along with it (helper tools, libraries)
    virtual bool stage_siblings() const { return true; }
};

/**
 * <root>/<subdir>/<binary>. Base for the directory-shaped candidates.
 */
class DirectoryStrategy : public ResolverStrategy {
protected:
    std::string subdir_;
    std::string binary_name_;

    virtual std::optional<fs::path> root() const = 0;

public:
    DirectoryStrategy(std::string subdir, std::string binary_name)
        : subdir_(std::move(subdir)), binary_name_(std::move(binary_name)) {}

    std::optional<fs::path> try_resolve() const override;
};

/**
 * Resources shipped inside a packaged bundle. The bundle directory comes from
 * configuration or, failing that, the TVBRIDGE_BUNDLE_DIR environment
 * variable set by the bundle's launcher.
 */
class BundledResourceStrategy : public DirectoryStrategy {
private:
    std::string bundle_dir_;

protected:
    std::optional<fs::path> root() const override;

public:
    BundledResourceStrategy(std::string bundle_dir, std::string subdir, std::string binary_name)
        : DirectoryStrategy(std::move(subdir), std::move(binary_name)),
          bundle_dir_(std::move(bundle_dir)) {}

    std::string name() const override { return "bundled-resources"; }
};

/**
 * Subdirectory next to the running executable.
 */
class PackageLocalStrategy : public DirectoryStrategy {
private:
    std::optional<fs::path> exe_dir_;

protected:
    std::optional<fs::path> root() const override;

public:
    // Empty exe_dir means "directory of /proc/self/exe"
    PackageLocalStrategy(std::optional<fs::path> exe_dir, std::string subdir, std::string binary_name)
        : DirectoryStrategy(std::move(subdir), std::move(binary_name)),
          exe_dir_(std::move(exe_dir)) {}

    std::string name() const override { return "package-local"; }
};

/**
 * Subdirectory of the current working directory.
 */
class WorkingDirectoryStrategy : public DirectoryStrategy {
private:
    std::optional<fs::path> cwd_;

protected:
    std::optional<fs::path> root() const override;

public:
    WorkingDirectoryStrategy(std::optional<fs::path> cwd, std::string subdir, std::string binary_name)
        : DirectoryStrategy(std::move(subdir), std::move(binary_name)),
          cwd_(std::move(cwd)) {}

    std::string name() const override { return "working-directory"; }
};

/**
 * First executable match on the search path.
 */
class SearchPathStrategy : public ResolverStrategy {
private:
    std::optional<std::string> path_env_;
    std::string binary_name_;

public:
    // Empty path_env means "read PATH at resolve time"
    SearchPathStrategy(std::optional<std::string> path_env, std::string binary_name)
        : path_env_(std::move(path_env)), binary_name_(std::move(binary_name)) {}

    std::optional<fs::path> try_resolve() const override;
    std::string name() const override { return "search-path"; }
    bool stage_siblings() const override { return false; }
};

bool is_executable_file(const fs::path& path);

/**
 * Evaluates the strategy chain in order, stages the first usable candidate
 * into a fresh mkdtemp directory and caches the result until cleanup().
 *
 * Successful resolution prepends the staging directory to PATH so the
 * bridge can find co-located helpers; cleanup() removes that entry again.
 */
class BinaryResolver {
private:
    std::vector<std::unique_ptr<ResolverStrategy>> strategies_;
    std::string staging_prefix_;
    std::string binary_name_;

    mutable std::mutex mutex_;
    std::optional<BinaryLocation> cached_;
    std::string path_entry_;

    std::optional<BinaryLocation> stage(const ResolverStrategy& strategy,
                                        const fs::path& candidate,
                                        std::string& failure);
    void prepend_to_search_path(const fs::path& dir);
    void remove_from_search_path();

public:
    BinaryResolver(std::vector<std::unique_ptr<ResolverStrategy>> strategies,
                   std::string staging_prefix,
                   std::string binary_name);
    ~BinaryResolver();

    BinaryResolver(const BinaryResolver&) = delete;
    BinaryResolver& operator=(const BinaryResolver&) = delete;

    /**
     * Standard chain: bundled resources, package-local, working directory,
     * search path.
     */
    static std::unique_ptr<BinaryResolver> from_config(const BridgeConfig& config);

    ResolveResult resolve();

    std::optional<BinaryLocation> cached() const;

    /**
     * Remove the staging directory and forget the cached location.
     * Safe to call repeatedly.
     */
    void cleanup();

    size_t strategy_count() const { return strategies_.size(); }
};

} // namespace TvBridge

#endif // BINARY_RESOLVER_H
