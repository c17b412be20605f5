#pragma once
#include "PatternCatalog.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include <hs/hs.h>

// Multi-regex matcher for one catalog tier, built on Hyperscan.
class PatternMatcherHS {
public:
    struct CompiledPattern {
        Pattern        pattern;
        hs_database_t* db{nullptr};   // this pattern alone, used when the tier scan fails
    };

    PatternMatcherHS();
    ~PatternMatcherHS();
    PatternMatcherHS(const PatternMatcherHS&) = delete;
    PatternMatcherHS& operator=(const PatternMatcherHS&) = delete;

    // Build (or rebuild) from a tier's patterns. Each pattern is compiled on
    // its own first; the ones that fail are logged and left out.
    // Returns false if the combined database cannot be built.
    bool build(const std::vector<Pattern>& patterns);

    // Indices into compiled() of every pattern occurring in 'text', ascending.
    // 'text' must be valid UTF-8. Throws std::length_error past UINT_MAX bytes.
    std::vector<size_t> scan(const std::string& text) const;

    const std::vector<CompiledPattern>& compiled() const { return compiled_; }
    size_t patternCount()  const { return compiled_.size(); }
    size_t rejectedCount() const { return rejected_; }
    bool   isReady()       const { return ready_; }

    static unsigned compileFlags();
    static void     checkScanLength(size_t bytes);

private:
    // HS state
    hs_database_t* db_{nullptr};
    hs_scratch_t*  base_scratch_{nullptr};
    bool           ready_{false};
    size_t         rejected_{0};
    std::vector<CompiledPattern> compiled_;

    // Scratch clones handed out per scan; one scratch per concurrent caller.
    mutable std::mutex                 scratch_mu_;
    mutable std::vector<hs_scratch_t*> scratch_pool_;

    hs_scratch_t* acquireScratch_() const;
    bool scanSingle_(const CompiledPattern& cp, const std::string& text,
                     hs_scratch_t* scratch, bool& matched) const;
    void freeAll_() noexcept;
};
