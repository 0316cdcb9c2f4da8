/********************************************************************
 * dlpmask-core.h  –  dlpmask core header
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
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstddef>

#include <unicode/uversion.h>

// Forward declare ICU's RegexPattern to avoid including the full header here
namespace U_ICU_NAMESPACE {
    class RegexPattern;
}

// =============================================================================//
// Standalone Functions and Constants
// =============================================================================//

/// Substitution marker used by tokenize/detokenize when none is configured.
constexpr const char* kDefaultToken = "[TOKEN]";
/// Literal that replaces every redacted span.
constexpr const char* kRedactedMarker = "[redacted]";

/**
 * @brief Gets the version string of the libdlpmask library.
 * @return A string in "MAJOR.MINOR.PATCH" format.
 */
std::string getDlpmaskVersion();

/// Detection categories. They overlap in intent only; counts are independent.
enum class Category { PII, SPII };

std::string categoryName(Category category);

/// Transformation applied to a document. Selected once per run.
enum class Mode { Tokenize, Detokenize, Redact };

/**
 * @brief Parses a mode name ("tokenize", "detokenize", "redact").
 * @throws std::invalid_argument for any other value.
 */
Mode parseMode(const std::string& name);
std::string modeName(Mode mode);


// =============================================================================//
// PatternSet Class
// =============================================================================//

/**
 * @brief Immutable set of compiled, case-insensitive recognizer rules.
 *
 * Holds two groups of patterns per category: the detection patterns used for
 * reporting (they accept an optional one-word qualifier before the phrase)
 * and the narrower phrase-only patterns used by redact. Copies share the
 * same compiled patterns.
 */
class PatternSet {
public:
    /// Regular expression sources, ICU syntax.
    struct Sources {
        std::string detectPii;
        std::string detectSpii;
        std::string redactPii;
        std::string redactSpii;
    };

    /** @brief Built-in vocabulary. */
    static Sources defaultSources();

    /** @brief Compiles the built-in vocabulary. */
    static PatternSet defaults();

    /**
     * @brief Compiles the given sources.
     * @throws std::runtime_error if ICU rejects a pattern.
     */
    static PatternSet fromSources(const Sources& sources);

    /**
     * @brief Loads a patterns.toml data file.
     *
     * Reads the `pii` and `spii` keys of the `[detect]` and `[redact]`
     * sections. Keys that are absent keep their built-in value.
     * @param path Path to the TOML file.
     * @throws std::runtime_error if the file cannot be read or a pattern
     * does not compile.
     */
    static PatternSet fromFile(const std::string& path);

    /**
     * @brief Loads patterns.toml from a data directory.
     * @param dataDir Directory holding patterns.toml. If empty, the system
     * data directories (/usr/share/libdlpmask/, /usr/local/share/libdlpmask/)
     * are searched and the built-in vocabulary is used when neither has one.
     * @throws std::runtime_error if an explicit dataDir has no patterns.toml.
     */
    static PatternSet fromDataDir(const std::string& dataDir = "");

    const Sources& sources() const;

    const U_ICU_NAMESPACE::RegexPattern& detectPattern(Category category) const;
    const U_ICU_NAMESPACE::RegexPattern& redactPattern(Category category) const;

private:
    class Impl;
    explicit PatternSet(std::shared_ptr<const Impl> impl);
    std::shared_ptr<const Impl> pImpl;
};


// =============================================================================//
// Detector Class
// =============================================================================//

/// One detected span. Offsets are byte offsets into the document.
struct Match {
    Category category;
    size_t offset;
    size_t length;
    std::string text;
};

/// Per-document match counts, computed before any transformation.
struct DetectionReport {
    size_t piiCount = 0;
    size_t spiiCount = 0;
};

/**
 * @brief Classifies spans of a document as PII or SPII. Never mutates input.
 *
 * Matching is leftmost-first and non-overlapping within a category. The two
 * categories are searched independently, so a span can be counted once in
 * each.
 */
class Detector {
public:
    explicit Detector(PatternSet patterns = PatternSet::defaults());

    /**
     * @brief Finds every match of a category's detection pattern.
     * @param document Raw file contents (UTF-8 expected, other bytes tolerated).
     * @param category The category to search for.
     * @return The matches in document order.
     */
    std::vector<Match> findAll(const std::string& document, Category category) const;

    size_t count(const std::string& document, Category category) const;

    /** @brief Counts both categories. */
    DetectionReport scan(const std::string& document) const;

private:
    PatternSet patterns_;
};


// =============================================================================//
// Transformer Class
// =============================================================================//

/**
 * @brief Produces a new document from an input document and a mode.
 *
 * - Tokenize replaces every maximal run of word characters (letters, digits,
 *   underscore) with the token. All other bytes are kept in place.
 * - Detokenize replaces each word-bounded literal occurrence of the token with
 *   its whitespace-trimmed text. It does NOT restore what tokenize erased: no
 *   mapping from token occurrences to original words is kept, so
 *   detokenize(tokenize(D, T), T) differs from D unless D was made of T
 *   tokens only. A reversible scheme would have to persist the original
 *   fragment for every token position alongside the output.
 * - Redact replaces the phrase-only PII matches, then the phrase-only SPII
 *   matches, with "[redacted]". Everything else passes through unchanged.
 */
class Transformer {
public:
    explicit Transformer(PatternSet patterns = PatternSet::defaults());
    ~Transformer();

    std::string transform(const std::string& document, Mode mode,
                          const std::string& token = kDefaultToken) const;

    /**
     * @brief Same as above with the mode given by name.
     * @throws std::invalid_argument for an unknown mode; no output is produced.
     */
    std::string transform(const std::string& document, const std::string& mode,
                          const std::string& token = kDefaultToken) const;

    std::string tokenize(const std::string& document, const std::string& token) const;
    std::string detokenize(const std::string& document, const std::string& token) const;
    std::string redact(const std::string& document) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};


// =============================================================================//
// FileProcessor Class
// =============================================================================//

/// Directories with more files than this get a single bulk approval prompt.
constexpr size_t kBulkPromptThreshold = 20;

/// Outcome of processing one file. Failures never abort a batch.
struct FileResult {
    std::string input;
    std::string output;
    DetectionReport report;
    bool scanned = false;  ///< The input was read and report is filled in.
    bool ok = false;
    std::string error;
};

/**
 * @brief Reads, scans, transforms and writes files one at a time.
 */
class FileProcessor {
public:
    struct Options {
        std::string mode = "tokenize";
        std::string token = kDefaultToken;
        std::string outputDir;  ///< Empty: write beside the source file.
    };

    explicit FileProcessor(Options options, PatternSet patterns = PatternSet::defaults());

    /**
     * @brief True for a directory under a protected system location
     * (/etc, /var and the Windows program and system folders).
     */
    static bool isIllegalDirectory(const std::string& path);

    /**
     * @brief True when path is root itself or lies below it. Compares whole
     * path components after lexical normalization, so "/etcetera" is not
     * within "/etc". The filesystem is not consulted.
     */
    static bool isWithinDirectory(const std::string& path, const std::string& root);

    /**
     * @brief Lists the regular files directly inside a directory, sorted by name.
     * @throws std::runtime_error if the directory cannot be read.
     */
    static std::vector<std::string> listFiles(const std::string& directory);

    /**
     * @brief Output location for an input file: "<stem>_redacted<ext>" in the
     * configured output directory when it exists, otherwise beside the input.
     */
    std::string outputPathFor(const std::string& inputPath) const;

    /**
     * @brief Processes one file end to end.
     *
     * Unreadable input, an unknown mode and an unwritable output are reported
     * in the returned FileResult. Nothing is written on failure.
     */
    FileResult processFile(const std::string& path) const;

    const Options& options() const { return options_; }

private:
    Options options_;
    Detector detector_;
    Transformer transformer_;
};

