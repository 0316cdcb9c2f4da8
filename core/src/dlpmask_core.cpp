/********************************************************************
 * dlpmask-core.cpp  –  dlpmask core implementation.
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#include "libdlpmask/dlpmask_core.h"

#include <algorithm>
#include <sstream>
#include <fstream>
#include <cctype>
#include <filesystem>
#include <stdexcept>

// ICU includes for regular expressions over UTF-8 text
#include <unicode/regex.h>
#include <unicode/unistr.h>
#include <unicode/utext.h>
#include <unicode/utypes.h>
#include <unicode/parseerr.h>

namespace fs = std::filesystem;

// =============================================================================//
// Standalone Function Implementations
// =============================================================================//

std::string getDlpmaskVersion() {
    // This macro is defined by the CMake build script
    return DLPMASK_VERSION;
}

std::string categoryName(Category category) {
    switch (category) {
        case Category::PII: return "PII";
        case Category::SPII: return "SPII";
    }
    return "UNKNOWN";
}

Mode parseMode(const std::string& name) {
    if (name == "tokenize") return Mode::Tokenize;
    if (name == "detokenize") return Mode::Detokenize;
    if (name == "redact") return Mode::Redact;
    throw std::invalid_argument("Unknown mode " + name);
}

std::string modeName(Mode mode) {
    switch (mode) {
        case Mode::Tokenize: return "tokenize";
        case Mode::Detokenize: return "detokenize";
        case Mode::Redact: return "redact";
    }
    return "unknown";
}

// ----------------- ICU helpers -----------------
namespace {

void throwIfFailed(UErrorCode status, const std::string& what) {
    if (U_FAILURE(status)) {
        throw std::runtime_error(what + ": " + u_errorName(status));
    }
}

std::unique_ptr<icu::RegexPattern> compilePattern(const std::string& source, uint32_t flags) {
    UParseError parseError;
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexPattern> pattern(
        icu::RegexPattern::compile(icu::UnicodeString::fromUTF8(source), flags, parseError, status));
    if (U_FAILURE(status)) {
        throw std::runtime_error("Invalid pattern '" + source + "' (line " +
                                 std::to_string(parseError.line) + ", offset " +
                                 std::to_string(parseError.offset) + "): " + u_errorName(status));
    }
    return pattern;
}

struct UTextCloser {
    void operator()(UText* text) const { utext_close(text); }
};

// Calls fn(start, end) for every match, in byte offsets of the UTF-8 input.
// Matching runs over a UTF-8 UText so native indexes map straight back to the
// original bytes, invalid sequences included.
template <typename Fn>
void forEachMatch(const icu::RegexPattern& pattern, const std::string& document, Fn&& fn) {
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<UText, UTextCloser> text(
        utext_openUTF8(nullptr, document.data(), static_cast<int64_t>(document.size()), &status));
    throwIfFailed(status, "utext_openUTF8");

    std::unique_ptr<icu::RegexMatcher> matcher(pattern.matcher(status));
    throwIfFailed(status, "RegexPattern::matcher");
    matcher->reset(text.get());

    while (matcher->find(status)) {
        int64_t start = matcher->start64(status);
        int64_t end = matcher->end64(status);
        throwIfFailed(status, "RegexMatcher::start/end");
        fn(static_cast<size_t>(start), static_cast<size_t>(end));
    }
    throwIfFailed(status, "RegexMatcher::find");
}

template <typename Replacer>
std::string replaceMatches(const icu::RegexPattern& pattern, const std::string& document, Replacer replacer) {
    std::string result;
    result.reserve(document.size());
    size_t last = 0;
    forEachMatch(pattern, document, [&](size_t start, size_t end) {
        result.append(document, last, start - last);
        result += replacer(document.substr(start, end - start));
        last = end;
    });
    result.append(document, last, std::string::npos);
    return result;
}

// Backslash-quotes ASCII punctuation so the token is matched literally.
std::string escapeRegexLiteral(const std::string& literal) {
    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::ispunct(uc)) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string trimWhitespace(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\n\v\f\r"));
    s.erase(s.find_last_not_of(" \t\n\v\f\r") + 1);
    return s;
}

std::string readFileContent(const fs::path& fullPath) {
    if (!fs::exists(fullPath)) {
        throw std::runtime_error("Could not locate data file: " + fullPath.string());
    }
    std::ifstream file(fullPath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open data file: " + fullPath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Parses a TOML string value: '''literal''', 'literal' or "basic".
// Anything after the closing quote (a comment) is ignored.
std::string parseTomlString(const std::string& raw) {
    if (raw.compare(0, 3, "'''") == 0) {
        size_t close = raw.find("'''", 3);
        if (close == std::string::npos) {
            throw std::runtime_error("Unterminated literal string: " + raw);
        }
        return raw.substr(3, close - 3);
    }
    if (!raw.empty() && raw.front() == '\'') {
        size_t close = raw.find('\'', 1);
        if (close == std::string::npos) {
            throw std::runtime_error("Unterminated literal string: " + raw);
        }
        return raw.substr(1, close - 1);
    }
    if (!raw.empty() && raw.front() == '"') {
        std::string result;
        for (size_t i = 1; i < raw.size(); ++i) {
            if (raw[i] == '"') {
                return result;
            }
            if (raw[i] == '\\' && i + 1 < raw.size()) {
                char next = raw[i + 1];
                if (next == '\\')
                    result += '\\';
                else if (next == 'n')
                    result += '\n';
                else if (next == 't')
                    result += '\t';
                else if (next == '"')
                    result += '"';
                else
                    result += next;
                ++i;
            } else {
                result += raw[i];
            }
        }
        throw std::runtime_error("Unterminated string: " + raw);
    }
    // Bare value, strip a trailing comment
    std::string value = raw.substr(0, raw.find('#'));
    value.erase(value.find_last_not_of(" \t") + 1);
    return value;
}

} // namespace


// =============================================================================//
// PatternSet Implementation (PImpl Idiom)
// =============================================================================//
class PatternSet::Impl {
public:
    Sources sources_;
    std::unique_ptr<icu::RegexPattern> detectPii_;
    std::unique_ptr<icu::RegexPattern> detectSpii_;
    std::unique_ptr<icu::RegexPattern> redactPii_;
    std::unique_ptr<icu::RegexPattern> redactSpii_;

    explicit Impl(const Sources& sources) : sources_(sources) {
        detectPii_ = compilePattern(sources_.detectPii, UREGEX_CASE_INSENSITIVE);
        detectSpii_ = compilePattern(sources_.detectSpii, UREGEX_CASE_INSENSITIVE);
        redactPii_ = compilePattern(sources_.redactPii, UREGEX_CASE_INSENSITIVE);
        redactSpii_ = compilePattern(sources_.redactSpii, UREGEX_CASE_INSENSITIVE);
    }

    static void parsePatternsToml(const std::string& content, Sources& sources);
};

void PatternSet::Impl::parsePatternsToml(const std::string& content, Sources& sources) {
    std::istringstream iss(content);
    std::string line, section;
    while (std::getline(iss, line)) {
        line.erase(0, line.find_first_not_of(" \t"));
        line.erase(line.find_last_not_of(" \t\r") + 1);
        if (line.empty() || line[0] == '#')
            continue;
        if (line[0] == '[' && line.back() == ']') {
            section = line.substr(1, line.size() - 2);
            continue;
        }
        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos)
            continue;
        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value = parseTomlString(value);
        if (value.empty())
            continue;

        if (section == "detect") {
            if (key == "pii") sources.detectPii = value;
            else if (key == "spii") sources.detectSpii = value;
        } else if (section == "redact") {
            if (key == "pii") sources.redactPii = value;
            else if (key == "spii") sources.redactSpii = value;
        }
    }
}

PatternSet::PatternSet(std::shared_ptr<const Impl> impl) : pImpl(std::move(impl)) {}

PatternSet::Sources PatternSet::defaultSources() {
    Sources sources;
    sources.detectPii =
        R"(\b(?:[a-z]+\s)?(?:SSN|social security number|driver's license|passport|credit card|debit card|bank account)\b)"
        R"(|\b(?:[a-z]+\s)?(?:first|last|middle|maiden|previous|current)\s?(?:name|initials)\b)"
        R"(|\b(?:[a-z]+\s)?(?:phone|fax|email|address|city|state|zip|postal)\s?(?:number|code)\b)";
    sources.detectSpii =
        R"(\b(?:[a-z]+\s)?(?:medical|health|insurance|benefits|prescription|treatment)\s?(?:information|record)\b)"
        R"(|\b(?:[a-z]+\s)?(?:ethnicity|race|sexual|gender|religion)\s?(?:identity|orientation)\b)";
    // Redaction masks the phrase alone, never the qualifier word before it.
    sources.redactPii =
        R"(\b(?:SSN|social security number|driver's license|passport|credit card|debit card|bank account)\b)";
    sources.redactSpii =
        R"(\b(?:medical|health|insurance|benefits|prescription|treatment)\s?(?:information|record)\b)";
    return sources;
}

PatternSet PatternSet::defaults() {
    return fromSources(defaultSources());
}

PatternSet PatternSet::fromSources(const Sources& sources) {
    return PatternSet(std::make_shared<const Impl>(sources));
}

PatternSet PatternSet::fromFile(const std::string& path) {
    std::string content = readFileContent(path);
    Sources sources = defaultSources();
    Impl::parsePatternsToml(content, sources);
    return fromSources(sources);
}

PatternSet PatternSet::fromDataDir(const std::string& dataDir) {
    if (!dataDir.empty()) {
        return fromFile((fs::path(dataDir) / "patterns.toml").string());
    }
    for (const char* dir : {"/usr/share/libdlpmask/", "/usr/local/share/libdlpmask/"}) {
        fs::path candidate = fs::path(dir) / "patterns.toml";
        if (fs::exists(candidate)) {
            return fromFile(candidate.string());
        }
    }
    return defaults();
}

const PatternSet::Sources& PatternSet::sources() const { return pImpl->sources_; }

const icu::RegexPattern& PatternSet::detectPattern(Category category) const {
    return category == Category::PII ? *pImpl->detectPii_ : *pImpl->detectSpii_;
}

const icu::RegexPattern& PatternSet::redactPattern(Category category) const {
    return category == Category::PII ? *pImpl->redactPii_ : *pImpl->redactSpii_;
}


// =============================================================================//
// Detector Implementation
// =============================================================================//

Detector::Detector(PatternSet patterns) : patterns_(std::move(patterns)) {}

std::vector<Match> Detector::findAll(const std::string& document, Category category) const {
    std::vector<Match> matches;
    forEachMatch(patterns_.detectPattern(category), document, [&](size_t start, size_t end) {
        matches.push_back(Match{category, start, end - start, document.substr(start, end - start)});
    });
    return matches;
}

size_t Detector::count(const std::string& document, Category category) const {
    size_t n = 0;
    forEachMatch(patterns_.detectPattern(category), document, [&n](size_t, size_t) { ++n; });
    return n;
}

DetectionReport Detector::scan(const std::string& document) const {
    DetectionReport report;
    report.piiCount = count(document, Category::PII);
    report.spiiCount = count(document, Category::SPII);
    return report;
}


// =============================================================================//
// Transformer Implementation (PImpl Idiom)
// =============================================================================//
class Transformer::Impl {
public:
    PatternSet patterns_;
    std::unique_ptr<icu::RegexPattern> wordPattern_;

    explicit Impl(PatternSet patterns)
        : patterns_(std::move(patterns)), wordPattern_(compilePattern(R"(\w+)", 0)) {}
};

Transformer::Transformer(PatternSet patterns) : pImpl(std::make_unique<Impl>(std::move(patterns))) {}
Transformer::~Transformer() = default;

std::string Transformer::transform(const std::string& document, Mode mode, const std::string& token) const {
    switch (mode) {
        case Mode::Tokenize: return tokenize(document, token);
        case Mode::Detokenize: return detokenize(document, token);
        case Mode::Redact: return redact(document);
    }
    throw std::invalid_argument("Unknown mode");
}

std::string Transformer::transform(const std::string& document, const std::string& mode,
                                   const std::string& token) const {
    return transform(document, parseMode(mode), token);
}

std::string Transformer::tokenize(const std::string& document, const std::string& token) const {
    return replaceMatches(*pImpl->wordPattern_, document,
                          [&token](const std::string&) { return token; });
}

std::string Transformer::detokenize(const std::string& document, const std::string& token) const {
    // Only the literal token itself can match here, so the original words are
    // not recovered. See the class documentation.
    std::unique_ptr<icu::RegexPattern> tokenPattern =
        compilePattern("\\b" + escapeRegexLiteral(token) + "\\b", 0);
    return replaceMatches(*tokenPattern, document,
                          [](const std::string& match) { return trimWhitespace(match); });
}

std::string Transformer::redact(const std::string& document) const {
    auto toMarker = [](const std::string&) { return std::string(kRedactedMarker); };
    std::string output = replaceMatches(pImpl->patterns_.redactPattern(Category::PII), document, toMarker);
    return replaceMatches(pImpl->patterns_.redactPattern(Category::SPII), output, toMarker);
}


// =============================================================================//
// FileProcessor Implementation
// =============================================================================//

FileProcessor::FileProcessor(Options options, PatternSet patterns)
    : options_(std::move(options)), detector_(patterns), transformer_(patterns) {}

bool FileProcessor::isWithinDirectory(const std::string& path, const std::string& root) {
    std::string normalized = fs::path(path).lexically_normal().generic_string();
    std::string base = fs::path(root).lexically_normal().generic_string();
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    if (base.empty() || normalized.compare(0, base.size(), base) != 0) {
        return false;
    }
    return normalized.size() == base.size() || normalized[base.size()] == '/' || base.back() == '/';
}

bool FileProcessor::isIllegalDirectory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return false;
    }
    fs::path absPath = fs::absolute(path, ec);
    if (ec) {
        return false;
    }
    static const char* const illegalDirs[] = {
        "/etc",
        "/var",
        "C:/Program Files",
        "C:/Program Files (x86)",
        "C:/Windows",
        "C:/Windows/System32",
    };
    for (const char* dir : illegalDirs) {
        if (isWithinDirectory(absPath.string(), dir)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> FileProcessor::listFiles(const std::string& directory) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw std::runtime_error("Could not access directory contents: " + directory + " (" + ec.message() + ")");
    }
    std::vector<std::string> files;
    while (it != fs::directory_iterator()) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            files.push_back(it->path().string());
        }
        // A failed increment may also leave the iterator at end.
        it.increment(ec);
        if (ec) {
            throw std::runtime_error("Could not access directory contents: " + directory + " (" + ec.message() + ")");
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string FileProcessor::outputPathFor(const std::string& inputPath) const {
    fs::path input(inputPath);
    std::string name = input.stem().string() + "_redacted" + input.extension().string();
    std::error_code ec;
    if (!options_.outputDir.empty() && fs::is_directory(options_.outputDir, ec)) {
        return (fs::path(options_.outputDir) / name).string();
    }
    return (input.parent_path() / name).string();
}

FileResult FileProcessor::processFile(const std::string& path) const {
    FileResult result;
    result.input = path;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.error = "Could not read input file " + path;
        return result;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        result.error = "Could not read input file " + path;
        return result;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        result.error = "Could not read input file " + path;
        return result;
    }
    const std::string document = buffer.str();
    in.close();

    std::string output;
    try {
        result.report = detector_.scan(document);
        result.scanned = true;
        output = transformer_.transform(document, options_.mode, options_.token);
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }

    std::string outputPath = outputPathFor(path);
    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        result.error = "Could not write output file " + outputPath;
        return result;
    }
    out.write(output.data(), static_cast<std::streamsize>(output.size()));
    out.close();
    if (!out) {
        // Drop the partial file
        fs::remove(outputPath, ec);
        result.error = "Could not write output file " + outputPath;
        return result;
    }

    result.output = outputPath;
    result.ok = true;
    return result;
}
