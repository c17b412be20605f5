// === src/PatternCatalog/PatternCatalog.cpp ===
#include "PatternCatalog.hpp"
#include "Fingerprint.hpp"

#include <algorithm>
#include <iostream>
#include <tuple>
#include <nlohmann/json.hpp>
using nlohmann::json;

// Rule set version 3.1.0. Expressions use the Hyperscan (PCRE subset) dialect:
// no lookaround, no backreferences, code points as \x{...}.
static const std::vector<Pattern> kCriticalPatterns = {
    // Secret/credential exfiltration
    {R"re((show|print|display|output|reveal|give|read|cat|type)\s*.{0,20}(config|\.env|clawdbot\.json|credential))re", Severity::Critical, "data_exfiltration"},
    {R"re((what('s| is)|tell me|give me)\s*.{0,15}(api[_-]?key|token|secret|password|credential))re", Severity::Critical, "data_exfiltration"},
    {R"re((show|print|display|output|reveal)\s*.{0,15}(token|key|secret|password))re", Severity::Critical, "data_exfiltration"},
    {R"re(echo\s+\$[A-Z_]*(KEY|TOKEN|SECRET|PASSWORD|CREDENTIAL))re", Severity::Critical, "data_exfiltration"},
    {R"re(cat\s+.{0,40}(\.env|config\.json|secret|credential|clawdbot))re", Severity::Critical, "data_exfiltration"},
    {R"re(env\s*\|\s*grep\s*.*(key|token|secret|password))re", Severity::Critical, "data_exfiltration"},

    // Dangerous system commands
    {R"re(rm\s+-rf\s+[/~])re", Severity::Critical, "system_destruction"},
    {R"re(:\(\)\{ :\|:& \};:)re", Severity::Critical, "fork_bomb"},
    {R"re(curl\s+.{0,50}\|\s*(ba)?sh)re", Severity::Critical, "remote_code_execution"},
    {R"re(wget\s+.{0,50}\|\s*(ba)?sh)re", Severity::Critical, "remote_code_execution"},
    {R"re(eval\s*\(\s*['"`])re", Severity::Critical, "code_injection"},

    // SQL injection
    {R"re(DROP\s+(TABLE|DATABASE|SCHEMA))re", Severity::Critical, "sql_injection"},
    {R"re(TRUNCATE\s+TABLE)re", Severity::Critical, "sql_injection"},
    {R"re(;\s*--\s*$)re", Severity::Critical, "sql_injection"},

    // Script injection
    {R"re(<script[^>]*>)re", Severity::Critical, "xss"},
    {R"re(javascript\s*:)re", Severity::Critical, "xss"},

    // System prompt extraction
    {R"re((repeat|echo|print|output|display|show)\s*.{0,20}(system\s+)?(prompt|instruction|directive|rule))re", Severity::Critical, "prompt_extraction"},
    {R"re((what|show|tell|reveal)\s*.{0,15}(are\s+)?(your|the)\s+(system\s+)?(instructions?|rules?|prompt|guidelines?))re", Severity::Critical, "prompt_extraction"},

    // Phishing templates
    {R"re((write|create|craft)\s*.{0,20}(email|message)\s*.{0,20}(password\s+reset|verify|confirm|login))re", Severity::Critical, "phishing"},
    {R"re((password|credential|account)\s*(reset|recovery|verification)\s*(email|message|notification))re", Severity::Critical, "phishing"},

    // MCP/tool abuse
    {R"re(read[_-]?url[_-]?content.{0,30}(\.env|credential|secret|key))re", Severity::Critical, "mcp_abuse"},
    {R"re(mcp.{0,30}(exfiltrat|send|upload|transmit).{0,20}(data|secret|token|key))re", Severity::Critical, "mcp_abuse"},

    // Auto-approve exploitation
    {R"re(always\s*allow.{0,50}(curl|bash|sh|wget|nc|netcat))re", Severity::Critical, "auto_approve_exploit"},
    {R"re(>\s*\(\s*(curl|wget|bash|sh))re", Severity::Critical, "auto_approve_exploit"},

    // Unicode tag block (invisible instructions)
    {R"re([\x{E0001}-\x{E007F}])re", Severity::Critical, "unicode_tag_injection"},
};

static const std::vector<Pattern> kHighPatterns = {
    // Instruction override
    {R"re(ignore\s+(all\s+)?(previous|prior|above|earlier|initial)\s+(instructions?|prompts?|rules?|guidelines?|directions?))re", Severity::High, "instruction_override", "en"},
    {R"re(disregard\s+(your|all|any|the)?\s*(instructions?|rules?|guidelines?|programming|training))re", Severity::High, "instruction_override", "en"},
    {R"re(forget\s+(everything|all|what)\s+(you\s+know|about|your|instructions?|training))re", Severity::High, "instruction_override", "en"},
    {R"re((이전|위의?|기존|원래)\s*(지시|명령|규칙|지침)(을|를|들?을?)?\s*(무시|잊어|버려|취소))re", Severity::High, "instruction_override", "ko"},
    {R"re((前の?|以前の?|これまでの)\s*(指示|命令|ルール)(を|は)?\s*(無視|忘れ|取り消))re", Severity::High, "instruction_override", "ja"},
    {R"re((忽略|无视|忘记|取消)\s*(之前|以前|上面|原来)的?\s*(指令|指示|规则|命令))re", Severity::High, "instruction_override", "zh"},

    // Jailbreak
    {R"re(jailbreak)re", Severity::High, "jailbreak"},
    {R"re(dan\s+mode)re", Severity::High, "jailbreak"},
    {R"re(do\s+anything\s+now)re", Severity::High, "jailbreak"},
    {R"re((no|without|remove)\s+(restrictions?|limitations?|filters?|safety|guardrails?))re", Severity::High, "jailbreak"},
    {R"re(bypass\s+(your|all|any|the)?\s*(restrictions?|filters?|safety|rules?))re", Severity::High, "jailbreak"},

    // System impersonation
    {R"re(\[?\s*(system|admin|root|developer|sudo|superuser|assistant|claude|gpt)\s*\]?\s*:)re", Severity::High, "system_impersonation"},
    {R"re(developer\s+mode\s*(enabled|activated|on)?)re", Severity::High, "system_impersonation"},
    {R"re(admin(istrator)?\s+(override|access|mode))re", Severity::High, "system_impersonation"},

    // Fake system prompt tags
    {R"re(<claude_\w+_info>)re", Severity::High, "system_mimicry"},
    {R"re(</claude_\w+_info>)re", Severity::High, "system_mimicry"},
    {R"re(<\|?(im_start|im_end|system|user|assistant)\|?>)re", Severity::High, "system_mimicry"},
    {R"re(\[INST\])re", Severity::High, "system_mimicry"},
    {R"re(<<SYS>>)re", Severity::High, "system_mimicry"},
    {R"re(GODMODE\s*:\s*(ENABLED|ON|ACTIVATED))re", Severity::High, "system_mimicry"},
    {R"re(DAN\s*:\s*(ENABLED|ON|ACTIVATED))re", Severity::High, "system_mimicry"},

    // Invisible characters
    {R"re([\x{200B}\x{200C}\x{200D}\x{2060}\x{FEFF}])re", Severity::High, "token_smuggling"},
    {R"re([\x{2062}\x{2063}\x{2064}])re", Severity::High, "token_smuggling"},
    {R"re([\x{00AD}])re", Severity::High, "token_smuggling"},

    // System file access
    {R"re((/etc/passwd|/etc/shadow|/etc/hosts|/etc/sudoers))re", Severity::High, "system_file_access"},
    {R"re((cat|read|show|display|type)\s*.{0,10}(/etc/|/var/|/root/|/home/|~/\.ssh/))re", Severity::High, "system_file_access"},
    {R"re((\.bash_history|\.zsh_history|\.ssh/|\.gnupg/))re", Severity::High, "system_file_access"},

    // Scenario jailbreak
    {R"re((dream|nightmare|story|novel|fiction|tale)\s*.{0,30}(hacker|attack|malicious|exploit|inject))re", Severity::High, "scenario_jailbreak"},
    {R"re((write|craft|create)\s+(a\s+)?(story|novel|scene|paragraph)\s*.{0,30}(hack|attack|malware|inject|exploit))re", Severity::High, "scenario_jailbreak"},
    {R"re((research|academic|scholarly)\s+(paper|study|experiment)\s*.{0,30}(attack|exploit|injection|denial))re", Severity::High, "scenario_jailbreak"},

    // Repetition/bypass
    {R"re((please\s+)?(ignore|bypass|disable|remove|turn\s+off)\s*.{0,10}(safety|security|restrictions?|filters?|guardrails?|rules?))re", Severity::High, "repetition_bypass"},
    {R"re((no|without|remove\s+all)\s+(safety|security)\s+(restrictions?|measures?|checks?))re", Severity::High, "repetition_bypass"},

    // Safety bypass
    {R"re((avoid|evade|bypass|circumvent|trick)\s*.{0,15}(filter|detection|safety|security|moderation))re", Severity::High, "safety_bypass"},
    {R"re((how\s+to\s+)?(get\s+)?(around|past|through)\s*.{0,15}(filter|block|restriction|safety))re", Severity::High, "safety_bypass"},

    // Indirect injection
    {R"re((fetch|load|read|open|visit|browse|check)\s*.{0,20}(this\s+)?(url|link|website|page|site))re", Severity::High, "indirect_injection"},
    {R"re((instructions?|commands?)\s+(in|from|inside)\s+(the\s+)?(file|document|attachment))re", Severity::High, "indirect_injection"},
    {R"re((text|message|instruction)\s+(in|on|inside)\s+(the\s+)?(image|picture|photo|screenshot))re", Severity::High, "indirect_injection"},

    // Hook hijacking
    {R"re((PreToolUse|PromptSubmit|PostToolUse)\s*(hook)?)re", Severity::High, "hooks_hijacking"},
    {R"re(auto[_-]?approve\s*.{0,20}(curl|command|tool|exec))re", Severity::High, "hooks_hijacking"},
    {R"re(permissions?\s*.{0,20}(override|bypass|ignore|disable))re", Severity::High, "hooks_hijacking"},

    // Subagent exploitation
    {R"re(browser\s*[_-]?subagent)re", Severity::High, "subagent_exploit"},
    {R"re(subagent\s*.{0,20}(exfiltrate|send|upload|transmit|leak))re", Severity::High, "subagent_exploit"},

    // .gitignore bypass
    {R"re(cat\s+\.env)re", Severity::High, "gitignore_bypass"},
    {R"re((terminal|shell|bash|cmd)\s*.{0,20}(read|cat|display)\s*.{0,20}\.env)re", Severity::High, "gitignore_bypass"},
    {R"re((bypass|ignore|skip)\s*.{0,20}\.gitignore)re", Severity::High, "gitignore_bypass"},
};

static const std::vector<Pattern> kMediumPatterns = {
    // Role manipulation
    // "you are now" followed by anything except going/about/ready/able/free
    {R"re(you\s+are\s+now\s+(\z|[^garf]|g(\z|[^o]|o(\z|[^i]|i(\z|[^n]|n(\z|[^g]))))|a(\z|[^b]|b(\z|[^lo]|l(\z|[^e])|o(\z|[^u]|u(\z|[^t]))))|r(\z|[^e]|e(\z|[^a]|a(\z|[^d]|d(\z|[^y]))))|f(\z|[^r]|r(\z|[^e]|e(\z|[^e])))))re", Severity::Medium, "role_manipulation", "en"},
    {R"re(pretend\s+(you\s+are|to\s+be|you're))re", Severity::Medium, "role_manipulation", "en"},
    {R"re(act\s+as\s+(if\s+you|a\s+|an?\s+))re", Severity::Medium, "role_manipulation", "en"},
    {R"re(roleplay\s+as)re", Severity::Medium, "role_manipulation", "en"},
    {R"re(i\s+want\s+you\s+to\s+(act|pretend|behave|be)\s+)re", Severity::Medium, "role_manipulation", "en"},
    {R"re((너는?|넌)\s*이제\s*(부터\s*)?.+이야)re", Severity::Medium, "role_manipulation", "ko"},
    {R"re((너는?|넌)\s*.+인?\s*척\s*해)re", Severity::Medium, "role_manipulation", "ko"},
    {R"re((あなた|君|きみ)は今から.+です)re", Severity::Medium, "role_manipulation", "ja"},
    {R"re(.+の?(ふり|フリ|振り)(を)?して)re", Severity::Medium, "role_manipulation", "ja"},
    {R"re((你|您)\s*现在\s*是.+)re", Severity::Medium, "role_manipulation", "zh"},
    {R"re(假装\s*(你|您)\s*是)re", Severity::Medium, "role_manipulation", "zh"},

    // Authority impersonation
    {R"re(i\s+am\s+(the\s+)?(admin|administrator|owner|developer|creator|maintainer))re", Severity::Medium, "authority_impersonation", "en"},
    {R"re((as\s+)?(the\s+)?(admin|owner|developer),?\s+i\s+(need|want|require|demand))re", Severity::Medium, "authority_impersonation", "en"},
    {R"re(authorized\s+(by|from)\s+(the\s+)?(owner|admin|developer|system))re", Severity::Medium, "authority_impersonation", "en"},
    {R"re((나는?|저는?|내가)\s*(관리자|어드민|admin|개발자|만든\s*사람|주인|오너))re", Severity::Medium, "authority_impersonation", "ko"},

    // Context hijacking
    {R"re((previous|earlier|last|above)\s+(message|conversation|context)\s*(said|mentioned|stated|was))re", Severity::Medium, "context_hijacking"},
    {R"re((as\s+)?we\s+(discussed|agreed|decided)\s+(earlier|before|previously))re", Severity::Medium, "context_hijacking"},
    {R"re((you\s+)?(already\s+)?(agreed|promised|said\s+you\s+would))re", Severity::Medium, "context_hijacking"},
    {R"re(\[?(previous\s+)?context\]?\s*[:=])re", Severity::Medium, "context_hijacking"},
    {R"re(<context>.*</context>)re", Severity::Medium, "context_hijacking"},

    // Multi-turn manipulation
    {R"re((now\s+)?(that\s+)?(you('ve|'re|\s+have|\s+are)|we('ve|\s+have))\s+(established|confirmed|agreed|done\s+that))re", Severity::Medium, "multi_turn"},
    {R"re((good|great|perfect|excellent),?\s+(now|next|so)\s+(let's|we\s+can|you\s+can))re", Severity::Medium, "multi_turn"},
    {R"re(step\s+\d+\s*[:=])re", Severity::Medium, "multi_turn"},
    {R"re((i\s+)?trust\s+you\s+(to|can|will))re", Severity::Medium, "multi_turn"},

    // Urgency/emotional manipulation
    {R"re((urgent|emergency|asap|immediately|right\s+now|hurry))re", Severity::Medium, "urgency_manipulation"},
    {R"re((no\s+time|running\s+out\s+of\s+time|time\s+is\s+running))re", Severity::Medium, "urgency_manipulation"},
    {R"re((ceo|boss|manager|director|president)\s*(wants|needs|demands|expects|said))re", Severity::Medium, "urgency_manipulation"},
};


const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Critical: return "critical";
        case Severity::High:     return "high";
        case Severity::Medium:   return "medium";
    }
    return "medium";
}

bool parse_severity(const std::string& name, Severity& out) {
    if (name == "critical") { out = Severity::Critical; return true; }
    if (name == "high")     { out = Severity::High;     return true; }
    if (name == "medium")   { out = Severity::Medium;   return true; }
    return false;
}


// Desc: build the catalog from the compiled-in rule table
// In: (none)
// Out: PatternCatalog
PatternCatalog PatternCatalog::builtin() {
    PatternCatalog c;
    c.tiers_[0] = kCriticalPatterns;
    c.tiers_[1] = kHighPatterns;
    c.tiers_[2] = kMediumPatterns;
    return c;
}

void PatternCatalog::add(const Pattern& p) {
    tiers_[static_cast<size_t>(p.severity)].push_back(p);
}

// Desc: append custom rules from config ("patterns" object)
// In: const json& j, std::string& error
// Out: bool (false on malformed entries; nothing is added then)
bool PatternCatalog::addCustomFromJson(const json& j, std::string& error) {
    if (j.is_null()) return true;
    if (!j.is_object()) {
        error = "'patterns' must be an object keyed by severity";
        return false;
    }

    std::vector<Pattern> staged;
    for (auto it = j.begin(); it != j.end(); ++it) {
        Severity sev;
        if (!parse_severity(it.key(), sev)) {
            error = "unknown severity '" + it.key() + "' in 'patterns'";
            return false;
        }
        if (!it.value().is_array()) {
            error = "'patterns." + it.key() + "' must be an array";
            return false;
        }
        for (const auto& item : it.value()) {
            Pattern p;
            p.severity = sev;
            p.category = "custom";
            if (item.is_string()) {
                p.expression = item.get<std::string>();
            } else if (item.is_object() && item.contains("expression") && item["expression"].is_string()) {
                p.expression = item["expression"].get<std::string>();
                if (item.contains("category")) {
                    if (!item["category"].is_string()) { error = "pattern 'category' must be a string"; return false; }
                    p.category = item["category"].get<std::string>();
                }
                if (item.contains("language")) {
                    if (!item["language"].is_string()) { error = "pattern 'language' must be a string"; return false; }
                    p.language = item["language"].get<std::string>();
                }
            } else {
                error = "'patterns." + it.key() + "' items must be strings or objects with 'expression'";
                return false;
            }
            if (p.expression.empty()) {
                error = "empty expression in 'patterns." + it.key() + "'";
                return false;
            }
            staged.push_back(std::move(p));
        }
    }
    for (const auto& p : staged) add(p);
    return true;
}

PatternCounts PatternCatalog::counts() const {
    PatternCounts c;
    c.critical = tiers_[0].size();
    c.high     = tiers_[1].size();
    c.medium   = tiers_[2].size();
    return c;
}

// Desc: verify per-tier and total rule counts reach the minimums
// In: std::string& error
// Out: bool (false if the catalog is suspiciously small)
bool PatternCatalog::checkIntegrity(std::string& error) const {
    const PatternCounts c = counts();
    if (c.critical < kMinCritical) {
        error = "expected >=" + std::to_string(kMinCritical) + " critical patterns, got " + std::to_string(c.critical);
        return false;
    }
    if (c.high < kMinHigh) {
        error = "expected >=" + std::to_string(kMinHigh) + " high patterns, got " + std::to_string(c.high);
        return false;
    }
    if (c.medium < kMinMedium) {
        error = "expected >=" + std::to_string(kMinMedium) + " medium patterns, got " + std::to_string(c.medium);
        return false;
    }
    if (c.total() < kMinTotal) {
        error = "expected >=" + std::to_string(kMinTotal) + " total patterns, got " + std::to_string(c.total());
        return false;
    }
    return true;
}

PatternCatalog PatternCatalog::filterLanguages(const std::vector<std::string>& languages) const {
    if (languages.empty() ||
        std::find(languages.begin(), languages.end(), "*") != languages.end()) {
        return *this;
    }
    PatternCatalog out;
    // critical rules target commands and payloads, not a natural language
    out.tiers_[static_cast<size_t>(Severity::Critical)] = tiers_[static_cast<size_t>(Severity::Critical)];
    for (size_t t = 0; t < tiers_.size(); ++t) {
        if (t == static_cast<size_t>(Severity::Critical)) continue;
        for (const auto& p : tiers_[t]) {
            if (std::find(languages.begin(), languages.end(), p.language) != languages.end()) {
                out.tiers_[t].push_back(p);
            }
        }
    }
    return out;
}

// Desc: build canonical JSON of rules (sorted per tier)
// In: (none)
// Out: std::string (JSON)
std::string PatternCatalog::canonicalRulesJson() const {
    json c = json::object();
    for (size_t t = 0; t < tiers_.size(); ++t) {
        std::vector<Pattern> sorted = tiers_[t];
        std::sort(sorted.begin(), sorted.end(), [](const Pattern& a, const Pattern& b) {
            return std::tie(a.expression, a.category, a.language) <
                   std::tie(b.expression, b.category, b.language);
        });
        json arr = json::array();
        for (const auto& p : sorted) {
            arr.push_back({{"expression", p.expression},
                           {"category", p.category},
                           {"language", p.language}});
        }
        c[severity_name(static_cast<Severity>(t))] = std::move(arr);
    }
    return c.dump();
}

std::string PatternCatalog::rulesetVersion() const {
    std::string h;
    if (!sha256_hex(canonicalRulesJson(), h, 16)) {
        std::cerr << "[PatternCatalog] ruleset hash failed\n";
        return "unknown";
    }
    return h;
}
