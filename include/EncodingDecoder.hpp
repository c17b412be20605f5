#pragma once
#include <cstddef>
#include <string>
#include <vector>

// One encoded segment found in content.
struct EncodingFinding {
    std::string encoding;   // "base64", "url" or "unicode_escape"
    std::string decoded;
    std::string original;   // first 50 characters, "..." appended when cut
};

// Report-only encoding detector. Not part of the verdict path.
class EncodingDecoder {
public:
    static constexpr size_t kMinBase64Run      = 20;
    static constexpr size_t kMinUrlRuns        = 3;
    static constexpr size_t kMinUnicodeRuns    = 2;
    static constexpr size_t kMinDecodedLength  = 20;   // url and unicode results must exceed this
    static constexpr size_t kOriginalPreview   = 50;

    static std::vector<EncodingFinding> decode_and_scan(const std::string& content);

    // Cheap precheck: a 30+ char Base64 run, 3 consecutive %XX, or 2 consecutive \uXXXX.
    static bool has_encoding(const std::string& content);

    // Decodes \uXXXX (surrogate pairs combined), \UXXXXXXXX and "\\".
    // Returns false on a code point above U+10FFFF.
    static bool unescape_unicode(const std::string& in, std::string& out);

private:
    static void scanBase64_(const std::string& content, std::vector<EncodingFinding>& out);
    static void scanUrl_(const std::string& content, std::vector<EncodingFinding>& out);
    static void scanUnicodeEscapes_(const std::string& content, std::vector<EncodingFinding>& out);
};
