#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

// Alternate textual views of scan input. All functions are pure; a decode
// step that fails leaves the text as it was.
class ContentNormalizer {
public:
    static constexpr int    kMaxDecodeIterations = 5;
    static constexpr size_t kMinBase64Length     = 20;

    // URL-percent and whole-string Base64 layers, peeled until nothing changes.
    static std::string fully_decode(const std::string& content);

    // Unwraps ~~ ** __ * _ ` spans, drops ``` blocks, heading and quote markers.
    static std::string strip_markdown(const std::string& content);

    // One percent-decoding pass; returns false if nothing was decoded.
    static bool url_decode(const std::string& in, std::string& out);
    // Strict Base64 ([A-Za-z0-9+/]*={0,2}, length % 4 == 0) into raw bytes.
    static bool base64_decode(const std::string& in, std::string& out);
    // Valid UTF-8, more than 10 code points, over 70% printable.
    static bool looks_like_text(const std::string& bytes);

    static bool        is_valid_utf8(const std::string& s);
    static std::string sanitize_utf8(const std::string& s);   // invalid bytes -> U+FFFD
    static size_t      utf8_length(const std::string& s);
    static std::string truncate_utf8(const std::string& s, size_t max_code_points);
    static std::string ascii_lower(std::string s);
    static void        append_utf8(std::string& out, uint32_t cp);
};
