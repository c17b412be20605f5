#include "PatternMatcherHS.hpp"
#include "ContentNormalizer.hpp"
#include <climits>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

// Returns the scratch to its pool when the scan is done.
class ScratchLease {
public:
    ScratchLease(hs_scratch_t* s, std::mutex& mu, std::vector<hs_scratch_t*>& pool)
        : s_(s), mu_(mu), pool_(pool) {}
    ~ScratchLease() {
        if (!s_) return;
        std::lock_guard<std::mutex> lk(mu_);
        pool_.push_back(s_);
    }
    ScratchLease(const ScratchLease&) = delete;
    ScratchLease& operator=(const ScratchLease&) = delete;

    hs_scratch_t* get() const { return s_; }

private:
    hs_scratch_t* s_;
    std::mutex& mu_;
    std::vector<hs_scratch_t*>& pool_;
};

std::string preview(const std::string& expr) {
    return ContentNormalizer::truncate_utf8(expr, 50);
}

} // namespace

PatternMatcherHS::PatternMatcherHS() = default;

PatternMatcherHS::~PatternMatcherHS() {
    freeAll_();
}

unsigned PatternMatcherHS::compileFlags() {
    return HS_FLAG_CASELESS | HS_FLAG_MULTILINE | HS_FLAG_UTF8 | HS_FLAG_UCP | HS_FLAG_SINGLEMATCH;
}

void PatternMatcherHS::freeAll_() noexcept {
    {
        std::lock_guard<std::mutex> lk(scratch_mu_);
        for (hs_scratch_t* s : scratch_pool_) hs_free_scratch(s);
        scratch_pool_.clear();
    }
    if (base_scratch_) { hs_free_scratch(base_scratch_); base_scratch_ = nullptr; }
    if (db_)           { hs_free_database(db_);           db_           = nullptr; }
    for (auto& cp : compiled_) {
        if (cp.db) hs_free_database(cp.db);
    }
    compiled_.clear();
    ready_ = false;
    rejected_ = 0;
}

bool PatternMatcherHS::build(const std::vector<Pattern>& patterns) {
    freeAll_();

    const unsigned flags = compileFlags();
    for (const auto& p : patterns) {
        hs_database_t* single = nullptr;
        hs_compile_error_t* ce = nullptr;
        hs_error_t rc = hs_compile(p.expression.c_str(), flags, HS_MODE_BLOCK, nullptr, &single, &ce);
        if (rc != HS_SUCCESS) {
            std::cerr << "[PatternMatcherHS] dropping pattern '" << preview(p.expression) << "': "
                      << (ce ? ce->message : "unknown error") << "\n";
            if (ce) hs_free_compile_error(ce);
            ++rejected_;
            continue;
        }
        if (ce) hs_free_compile_error(ce);
        compiled_.push_back(CompiledPattern{p, single});
    }

    if (compiled_.empty()) {
        // Nothing usable: ready, but scan() never reports a match
        ready_ = true;
        return true;
    }

    std::vector<const char*> cpat;
    std::vector<unsigned> cflags;
    std::vector<unsigned> ids;
    cpat.reserve(compiled_.size());
    cflags.reserve(compiled_.size());
    ids.reserve(compiled_.size());
    for (size_t i = 0; i < compiled_.size(); ++i) {
        cpat.push_back(compiled_[i].pattern.expression.c_str());
        cflags.push_back(flags);
        ids.push_back(static_cast<unsigned>(i));
    }

    hs_compile_error_t* ce = nullptr;
    hs_error_t rc = hs_compile_multi(
        cpat.data(),
        cflags.data(),
        ids.data(),
        static_cast<unsigned>(cpat.size()),
        HS_MODE_BLOCK,
        nullptr,
        &db_,
        &ce
    );

    if (rc != HS_SUCCESS) {
        if (ce) {
            std::cerr << "[PatternMatcherHS] compile failed: " << ce->message << "\n";
            hs_free_compile_error(ce);
        } else {
            std::cerr << "[PatternMatcherHS] compile failed (unknown)\n";
        }
        freeAll_();
        return false;
    }
    if (ce) hs_free_compile_error(ce);

    // One scratch large enough for the tier database and every single one
    rc = hs_alloc_scratch(db_, &base_scratch_);
    for (size_t i = 0; rc == HS_SUCCESS && i < compiled_.size(); ++i) {
        rc = hs_alloc_scratch(compiled_[i].db, &base_scratch_);
    }
    if (rc != HS_SUCCESS) {
        std::cerr << "[PatternMatcherHS] hs_alloc_scratch failed: " << rc << "\n";
        freeAll_();
        return false;
    }

    ready_ = true;
    return true;
}

hs_scratch_t* PatternMatcherHS::acquireScratch_() const {
    {
        std::lock_guard<std::mutex> lk(scratch_mu_);
        if (!scratch_pool_.empty()) {
            hs_scratch_t* s = scratch_pool_.back();
            scratch_pool_.pop_back();
            return s;
        }
    }
    if (!base_scratch_) {
        std::cerr << "[PatternMatcherHS] base scratch is null\n";
        return nullptr;
    }
    hs_scratch_t* s = nullptr;
    if (hs_clone_scratch(base_scratch_, &s) != HS_SUCCESS) {
        std::cerr << "[PatternMatcherHS] hs_clone_scratch failed\n";
        return nullptr;
    }
    return s;
}

// Desc: run one pattern's own database over text
// In: const CompiledPattern& cp, const std::string& text, hs_scratch_t* scratch, bool& matched
// Out: bool (false if the scan itself errored)
bool PatternMatcherHS::scanSingle_(const CompiledPattern& cp, const std::string& text,
                                   hs_scratch_t* scratch, bool& matched) const {
    matched = false;
    auto on_match = [](unsigned int, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        *static_cast<bool*>(ctx) = true;
        return HS_SCAN_TERMINATED;
    };
    hs_error_t rc = hs_scan(cp.db, text.data(), static_cast<unsigned int>(text.size()),
                            0, scratch, on_match, &matched);
    if (rc != HS_SUCCESS && rc != HS_SCAN_TERMINATED) {
        std::cerr << "[PatternMatcherHS] pattern '" << preview(cp.pattern.expression)
                  << "' scan error: " << rc << "\n";
        matched = false;
        return false;
    }
    return true;
}

// Desc: hs_scan takes an unsigned int length; larger inputs cannot be scanned
// In: size_t bytes
// Out: void (throws std::length_error above UINT_MAX)
void PatternMatcherHS::checkScanLength(size_t bytes) {
    if (bytes > UINT_MAX) {
        throw std::length_error("[PatternMatcherHS] input too large to scan: " +
                                std::to_string(bytes) + " bytes");
    }
}

std::vector<size_t> PatternMatcherHS::scan(const std::string& text) const {
    std::vector<size_t> hits;
    if (!ready_ || compiled_.empty()) return hits;
    checkScanLength(text.size());

    ScratchLease lease(acquireScratch_(), scratch_mu_, scratch_pool_);
    if (!lease.get()) return hits;

    std::vector<char> seen(compiled_.size(), 0);
    auto on_match = [](unsigned int id, unsigned long long, unsigned long long, unsigned int, void* ctx) -> int {
        auto* s = static_cast<std::vector<char>*>(ctx);
        if (id < s->size()) (*s)[id] = 1;
        return 0;
    };

    hs_error_t rc = hs_scan(
        db_,
        text.data(),
        static_cast<unsigned int>(text.size()),
        0,
        lease.get(),
        on_match,
        &seen
    );

    if (rc != HS_SUCCESS) {
        // A failing pattern only costs its own match
        std::cerr << "[PatternMatcherHS] hs_scan error: " << rc << ", scanning patterns one by one\n";
        for (size_t i = 0; i < compiled_.size(); ++i) {
            bool matched = false;
            seen[i] = (scanSingle_(compiled_[i], text, lease.get(), matched) && matched) ? 1 : 0;
        }
    }

    for (size_t i = 0; i < seen.size(); ++i) {
        if (seen[i]) hits.push_back(i);
    }
    return hits;
}
