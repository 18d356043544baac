// === src/PatternMatcherHS/PatternMatcherHS.cpp ===
#include "PatternMatcherHS.hpp"
#include "Logger.hpp"

PatternMatcherHS::PatternMatcherHS() = default;

PatternMatcherHS::~PatternMatcherHS() {
    freeAll_();
}

void PatternMatcherHS::freeAll_() noexcept {
    if (scratch_) { hs_free_scratch(scratch_); scratch_ = nullptr; }
    if (db_)      { hs_free_database(db_);     db_      = nullptr; }
    ready_ = false;
    count_ = 0;
}

bool PatternMatcherHS::build(const std::vector<std::string>& pats, std::string* err) {
    freeAll_();

    count_ = pats.size();
    if (pats.empty()) {
        // No patterns: ready but trivially false on matches()
        ready_ = true;
        return true;
    }

    std::vector<const char*> cpat;
    cpat.reserve(pats.size());
    for (auto& s : pats) cpat.push_back(s.c_str());

    // mirror case-insensitive regex; keys are single line
    std::vector<unsigned> flags(pats.size(), HS_FLAG_CASELESS | HS_FLAG_SINGLEMATCH | HS_FLAG_ALLOWEMPTY);

    std::vector<unsigned> ids;
    ids.reserve(pats.size());
    for (size_t i = 0; i < pats.size(); ++i) ids.push_back(static_cast<unsigned>(i));

    hs_compile_error_t* ce = nullptr;
    hs_error_t rc = hs_compile_multi(
        cpat.data(),
        flags.data(),
        ids.data(),
        static_cast<unsigned>(cpat.size()),
        HS_MODE_BLOCK,
        nullptr,
        &db_,
        &ce
    );

    if (rc != HS_SUCCESS) {
        const std::string msg = ce ? std::string("compile failed: ") + ce->message
                                   : std::string("compile failed (unknown)");
        if (ce) hs_free_compile_error(ce);
        if (err) *err = msg;
        log_warn("PatternMatcherHS", msg);
        freeAll_();
        return false;
    }
    if (ce) hs_free_compile_error(ce);

    rc = hs_alloc_scratch(db_, &scratch_);
    if (rc != HS_SUCCESS) {
        const std::string msg = "hs_alloc_scratch failed: " + std::to_string(rc);
        if (err) *err = msg;
        log_warn("PatternMatcherHS", msg);
        freeAll_();
        return false;
    }

    ready_ = true;
    return true;
}

bool PatternMatcherHS::matches(const std::string& text) const {
    if (!ready_) return false;
    if (count_ == 0) return false;

    bool matched = false;
    auto on_match = [](unsigned int, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        *static_cast<bool*>(ctx) = true;
        return 1;  // stop scanning
    };

    std::lock_guard<std::mutex> lk(scan_mu_);
    hs_error_t rc = hs_scan(
        db_,
        text.data(),
        static_cast<unsigned int>(text.size()),
        0,
        scratch_,
        on_match,
        &matched
    );

    if (rc != HS_SUCCESS && rc != HS_SCAN_TERMINATED) {
        log_warn("PatternMatcherHS", "hs_scan error: " + std::to_string(rc));
        return false;
    }
    return matched;
}


// Desc: convert glob to anchored regex, escaping regex metacharacters
// In: const std::string& glob
// Out: std::string (regex)
std::string PatternMatcherHS::globToRegex(const std::string& glob) {
    std::string re = "^";
    bool in_class = false;
    for (char c : glob) {
        if (in_class) {
            if (c == ']') in_class = false;
            if (c == '\\') { re += "\\\\"; continue; }
            re += c;
            continue;
        }
        switch (c) {
            case '*': re += ".*"; break;
            case '?': re += '.';  break;
            case '[': re += '['; in_class = true; break;
            case '.': case '+': case '(': case ')': case '{': case '}':
            case '^': case '$': case '|': case '\\': case ']':
                re += '\\'; re += c; break;
            default: re += c;
        }
    }
    if (in_class) re += ']';
    re += '$';
    return re;
}
