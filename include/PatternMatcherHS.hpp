// === include/PatternMatcherHS.hpp ===
#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <hs/hs.h>

// Multi-regex matcher over cache keys, built on Hyperscan. Patterns are
// compiled caseless; a key matches if any pattern matches anywhere in it.
class PatternMatcherHS {
public:
    PatternMatcherHS();
    ~PatternMatcherHS();
    PatternMatcherHS(const PatternMatcherHS&) = delete;
    PatternMatcherHS& operator=(const PatternMatcherHS&) = delete;

    // Build (or rebuild). Returns false and fills err if compilation fails.
    bool build(const std::vector<std::string>& patterns, std::string* err = nullptr);
    bool build(const std::string& pattern, std::string* err = nullptr) {
        return build(std::vector<std::string>{pattern}, err);
    }

    bool matches(const std::string& text) const;

    size_t patternCount() const { return count_; }
    bool   isReady()      const { return ready_; }

    // Translate a shell glob (*, ?, [...]) into an anchored regex.
    static std::string globToRegex(const std::string& glob);

private:
    hs_database_t* db_{nullptr};
    hs_scratch_t*  scratch_{nullptr};
    bool           ready_{false};
    size_t         count_{0};
    // one scratch per matcher; scans are serialized
    mutable std::mutex scan_mu_;

    void freeAll_() noexcept;
};
