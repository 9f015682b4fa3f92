// src/binary_resolver.cpp
#include "binary_resolver.h"

#include <syslog.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include "bridge_config.h"
#include "file_digest.h"

namespace TvBridge {

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

// ===== STRATEGIES =====

std::optional<fs::path> DirectoryStrategy::try_resolve() const {
    auto base = root();
    if (!base) return std::nullopt;

    fs::path candidate = *base / subdir_ / binary_name_;
    if (is_executable_file(candidate)) {
        return candidate;
    }
    syslog(LOG_DEBUG, "Resolver %s: no executable at %s", name().c_str(), candidate.c_str());
    return std::nullopt;
}

std::optional<fs::path> BundledResourceStrategy::root() const {
    if (!bundle_dir_.empty()) {
        return fs::path(bundle_dir_);
    }
    const char* env = getenv("TVBRIDGE_BUNDLE_DIR");
    if (env && *env) {
        return fs::path(env);
    }
    // Not running from a bundle
    return std::nullopt;
}

std::optional<fs::path> PackageLocalStrategy::root() const {
    if (exe_dir_) return exe_dir_;

    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        syslog(LOG_WARNING, "Resolver %s: cannot read /proc/self/exe: %s",
               name().c_str(), ec.message().c_str());
        return std::nullopt;
    }
    return exe.parent_path();
}

std::optional<fs::path> WorkingDirectoryStrategy::root() const {
    if (cwd_) return cwd_;

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        syslog(LOG_WARNING, "Resolver %s: cannot determine working directory: %s",
               name().c_str(), ec.message().c_str());
        return std::nullopt;
    }
    return cwd;
}

std::optional<fs::path> SearchPathStrategy::try_resolve() const {
    std::string search;
    if (path_env_) {
        search = *path_env_;
    } else {
        const char* env = getenv("PATH");
        if (!env) return std::nullopt;
        search = env;
    }

    size_t start = 0;
    while (start <= search.size()) {
        size_t end = search.find(':', start);
        if (end == std::string::npos) end = search.size();
        std::string dir = search.substr(start, end - start);
        // An empty PATH element means the current directory
        if (dir.empty()) dir = ".";

        fs::path candidate = fs::path(dir) / binary_name_;
        if (is_executable_file(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

// ===== RESOLVER =====

BinaryResolver::BinaryResolver(std::vector<std::unique_ptr<ResolverStrategy>> strategies,
                               std::string staging_prefix,
                               std::string binary_name)
    : strategies_(std::move(strategies)),
      staging_prefix_(std::move(staging_prefix)),
      binary_name_(std::move(binary_name)) {}

BinaryResolver::~BinaryResolver() {
    cleanup();
}

std::unique_ptr<BinaryResolver> BinaryResolver::from_config(const BridgeConfig& config) {
    std::vector<std::unique_ptr<ResolverStrategy>> chain;
    chain.push_back(std::make_unique<BundledResourceStrategy>(
        config.bundle_dir, config.bridge_subdir, config.binary_name));
    chain.push_back(std::make_unique<PackageLocalStrategy>(
        std::nullopt, config.bridge_subdir, config.binary_name));
    chain.push_back(std::make_unique<WorkingDirectoryStrategy>(
        std::nullopt, config.bridge_subdir, config.binary_name));
    chain.push_back(std::make_unique<SearchPathStrategy>(std::nullopt, config.binary_name));

    return std::make_unique<BinaryResolver>(std::move(chain), config.staging_prefix,
                                            config.binary_name);
}

ResolveResult BinaryResolver::resolve() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (cached_) {
        return *cached_;
    }

    std::string reasons;
    for (const auto& strategy : strategies_) {
        auto candidate = strategy->try_resolve();
        if (!candidate) {
            reasons += strategy->name() + ": not found; ";
            continue;
        }

        std::string failure;
        auto location = stage(*strategy, *candidate, failure);
        if (!location) {
            syslog(LOG_WARNING, "Resolver %s: staging %s failed: %s",
                   strategy->name().c_str(), candidate->c_str(), failure.c_str());
            reasons += strategy->name() + ": " + failure + "; ";
            continue;
        }

        prepend_to_search_path(location->staging_dir);
        cached_ = *location;

        syslog(LOG_INFO, "Bridge binary resolved via %s: %s (staged at %s, sha256=%s)",
               location->strategy.c_str(), location->source.c_str(),
               location->binary.c_str(), location->sha256.c_str());
        return *location;
    }

    if (strategies_.empty()) {
        reasons = "no resolver strategies configured";
    } else if (reasons.size() >= 2) {
        reasons.resize(reasons.size() - 2);
    }

    syslog(LOG_ERR, "Bridge binary '%s' not found: %s", binary_name_.c_str(), reasons.c_str());
    return ResolutionError{"'" + binary_name_ + "' not found (" + reasons + ")"};
}

std::optional<BinaryLocation> BinaryResolver::stage(const ResolverStrategy& strategy,
                                                    const fs::path& candidate,
                                                    std::string& failure) {
    std::error_code ec;

    fs::path prefix(staging_prefix_);
    if (prefix.has_parent_path()) {
        fs::create_directories(prefix.parent_path(), ec);
        if (ec) {
            failure = "cannot create " + prefix.parent_path().string() + ": " + ec.message();
            return std::nullopt;
        }
    }

    std::string templ = staging_prefix_ + "XXXXXX";
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        failure = std::string("mkdtemp failed: ") + strerror(errno);
        return std::nullopt;
    }
    fs::path staging_dir(buf.data());

    auto abandon = [&](const std::string& why) -> std::optional<BinaryLocation> {
        failure = why;
        std::error_code rm_ec;
        fs::remove_all(staging_dir, rm_ec);
        return std::nullopt;
    };

    auto copy_one = [&](const fs::path& src) -> bool {
        fs::path dest = staging_dir / src.filename();
        std::error_code copy_ec;
        fs::copy_file(src, dest, fs::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            failure = "copy " + src.string() + ": " + copy_ec.message();
            return false;
        }
        fs::permissions(dest, fs::status(src, copy_ec).permissions(),
                        fs::perm_options::replace, copy_ec);
        if (copy_ec) {
            syslog(LOG_WARNING, "Cannot copy permissions to %s: %s",
                   dest.c_str(), copy_ec.message().c_str());
        }
        syslog(LOG_DEBUG, "Staged %s", src.filename().c_str());
        return true;
    };

    if (strategy.stage_siblings()) {
        for (const auto& entry : fs::directory_iterator(candidate.parent_path(), ec)) {
            std::error_code type_ec;
            if (!entry.is_regular_file(type_ec) || type_ec) continue;
            if (!copy_one(entry.path())) return abandon(failure);
        }
        if (ec) {
            return abandon("cannot list " + candidate.parent_path().string() + ": " + ec.message());
        }
    } else if (!copy_one(candidate)) {
        return abandon(failure);
    }

    BinaryLocation location;
    location.binary = staging_dir / candidate.filename();
    location.staging_dir = staging_dir;
    location.source = candidate;
    location.strategy = strategy.name();

    if (!is_executable_file(location.binary)) {
        return abandon("staged copy is not executable");
    }

    std::string source_digest = sha256_file(candidate.string());
    location.sha256 = sha256_file(location.binary.string());
    if (source_digest.empty() || location.sha256.empty()) {
        return abandon("cannot compute digest");
    }
    if (source_digest != location.sha256) {
        return abandon("staged copy differs from source");
    }

    return location;
}

std::optional<BinaryLocation> BinaryResolver::cached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_;
}

void BinaryResolver::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!cached_) return;

    remove_from_search_path();

    std::error_code ec;
    fs::remove_all(cached_->staging_dir, ec);
    if (ec) {
        syslog(LOG_WARNING, "Failed to remove staging directory %s: %s",
               cached_->staging_dir.c_str(), ec.message().c_str());
    } else {
        syslog(LOG_INFO, "Removed staging directory %s", cached_->staging_dir.c_str());
    }
    cached_.reset();
}

void BinaryResolver::prepend_to_search_path(const fs::path& dir) {
    const char* current = getenv("PATH");
    std::string value = dir.string();
    if (current && *current) {
        value += ":";
        value += current;
    }
    if (setenv("PATH", value.c_str(), 1) != 0) {
        syslog(LOG_WARNING, "Failed to update PATH: %s", strerror(errno));
        return;
    }
    path_entry_ = dir.string();
}

void BinaryResolver::remove_from_search_path() {
    if (path_entry_.empty()) return;

    const char* current = getenv("PATH");
    if (!current) {
        path_entry_.clear();
        return;
    }

    std::string search = current;
    std::vector<std::string> kept;
    bool removed = false;
    size_t start = 0;
    while (start <= search.size()) {
        size_t end = search.find(':', start);
        if (end == std::string::npos) end = search.size();
        std::string dir = search.substr(start, end - start);
        if (!removed && dir == path_entry_) {
            removed = true;
        } else {
            kept.push_back(dir);
        }
        start = end + 1;
    }

    std::string rebuilt;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) rebuilt += ":";
        rebuilt += kept[i];
    }

    if (removed && setenv("PATH", rebuilt.c_str(), 1) != 0) {
        syslog(LOG_WARNING, "Failed to restore PATH: %s", strerror(errno));
    }
    path_entry_.clear();
}

} // namespace TvBridge
