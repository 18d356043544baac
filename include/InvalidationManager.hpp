// === include/InvalidationManager.hpp ===
#pragma once
#include "TierManager.hpp"

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class PatternSyntax : uint8_t { Regex = 0, Glob };

struct InvalidationOptions {
    PatternSyntax syntax{PatternSyntax::Regex};
    bool include_volatile{false};
    bool include_durable{true};
};

struct InvalidationResult {
    std::string pattern;            // as matched (globs already translated)
    size_t durable_deleted{0};
    bool volatile_supported{true};  // false when volatile deletion was asked for and skipped
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

// Pattern deletion against the durable tier. The volatile tier has no key
// index, so pattern deletion there is not supported; entries age out by TTL.
class InvalidationManager {
public:
    explicit InvalidationManager(TierManager& manager) : manager_(manager) {}

    InvalidationResult invalidate(const std::string& pattern,
                                  const InvalidationOptions& options = {});

    // Exact deletion of one (type, params) entry from both tiers.
    // Throws NormalizationError on malformed input.
    bool invalidate_key(const std::string& type, const nlohmann::json& params,
                        const KeyOptions& options = {});

    // Sweep expired durable rows; returns how many were removed (0 on fault).
    size_t purge_expired();

private:
    TierManager& manager_;
};
