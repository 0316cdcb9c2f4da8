#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <string>
#include <memory>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <libdlpmask/dlpmask_core.h>

namespace fs = std::filesystem;

// Forward declarations
void printHelp();
bool askYesNo(const std::string& question);
int runScan(const std::string& path, const PatternSet& patterns);

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    bool testMode = false;
    bool assumeYes = false;
    std::string filePath;
    std::string patternsPath;
    FileProcessor::Options options;

    // --- Argument Parsing ---
    auto takeValue = [&args](std::vector<std::string>::iterator& it, std::string& out) -> bool {
        std::string flag = *it;
        it = args.erase(it);
        if (it == args.end()) {
            std::cerr << "Error: " << flag << " requires a value." << std::endl;
            return false;
        }
        out = *it;
        it = args.erase(it);
        return true;
    };

    auto it = args.begin();
    while (it != args.end()) {
        if (*it == "-test") {
            testMode = true;
            it = args.erase(it);
        } else if (*it == "--yes" || *it == "-y") {
            assumeYes = true;
            it = args.erase(it);
        } else if (*it == "--file") {
            if (!takeValue(it, filePath)) return 1;
        } else if (*it == "--mode") {
            if (!takeValue(it, options.mode)) return 1;
        } else if (*it == "--token") {
            if (!takeValue(it, options.token)) return 1;
        } else if (*it == "--output") {
            if (!takeValue(it, options.outputDir)) return 1;
        } else if (*it == "--patterns") {
            if (!takeValue(it, patternsPath)) return 1;
        } else {
            ++it;
        }
    }

    std::string command = args.empty() ? "" : args[0];

    //  Command Handling
    if (command == "help" || (command.empty() && filePath.empty() && argc == 1)) {
        printHelp();
        return 0;
    }
    if (command == "--version" || command == "version") {
        std::cout << "libdlpmask version " << DLPMASK_VERSION << std::endl;
        return 0;
    }

    // Pattern configuration
    std::unique_ptr<PatternSet> patterns;
    try {
        if (!patternsPath.empty()) {
            patterns = std::make_unique<PatternSet>(PatternSet::fromFile(patternsPath));
        } else if (testMode) {
#ifdef DLPMASK_SRC_DIR
            fs::path dataDir = fs::path(DLPMASK_SRC_DIR) / "core" / "data";
            std::cout << "[Test Mode]: Using local data files from: " << dataDir << std::endl;
            patterns = std::make_unique<PatternSet>(PatternSet::fromDataDir(dataDir.string()));
#else
            std::cerr << "Error: Test mode requires DLPMASK_SRC_DIR to be set at compile time." << std::endl;
            return 1;
#endif
        } else {
            patterns = std::make_unique<PatternSet>(PatternSet::fromDataDir());
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (command == "scan") {
        if (args.size() < 2) {
            std::cerr << "Usage: dlpmask-cli scan <file_or_directory>" << std::endl;
            return 1;
        }
        return runScan(args[1], *patterns);
    }
    if (!command.empty()) {
        std::cerr << "Unknown command: " << command << std::endl;
        printHelp();
        return 1;
    }

    // --- File processing ---
    if (filePath.empty()) {
        std::cerr << "Error: File or directory path is required" << std::endl;
        return 1;
    }
    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        std::cerr << "Error: Could not access file or directory" << std::endl;
        return 1;
    }
    if (FileProcessor::isIllegalDirectory(filePath)) {
        std::cerr << "Error: Illegal directory selected" << std::endl;
        return 1;
    }
    try {
        parseMode(options.mode);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    FileProcessor processor(options, *patterns);

    std::vector<std::string> files;
    bool approveAll = assumeYes;
    if (fs::is_directory(filePath, ec)) {
        try {
            files = FileProcessor::listFiles(filePath);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
        if (!approveAll && files.size() > kBulkPromptThreshold) {
            approveAll = askYesNo("Found " + std::to_string(files.size()) +
                                  " files in directory. Do you want to process all of them?");
        }
    } else {
        files.push_back(filePath);
    }

    int failures = 0;
    for (const auto& file : files) {
        if (!approveAll && !askYesNo("Process file " + file + "?")) {
            continue;
        }
        FileResult result = processor.processFile(file);
        if (result.scanned) {
            std::cout << "Processing " << file << "... Found " << result.report.piiCount
                      << " PII matches and " << result.report.spiiCount << " SPII matches" << std::endl;
        }
        if (result.ok) {
            std::cout << "Processed " << file << ", output saved to " << result.output << std::endl;
        } else {
            std::cerr << "Error: " << result.error << std::endl;
            ++failures;
        }
    }

    return failures == 0 ? 0 : 1;
}

bool askYesNo(const std::string& question) {
    std::cout << question << " (y/n): " << std::flush;
    std::string input;
    if (!std::getline(std::cin, input)) {
        return false;
    }
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return input == "y";
}

int runScan(const std::string& path, const PatternSet& patterns) {
    std::vector<std::string> files;
    std::error_code ec;
    try {
        if (fs::is_directory(path, ec)) {
            files = FileProcessor::listFiles(path);
        } else {
            files.push_back(path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Detector detector(patterns);
    int failures = 0;
    for (const auto& file : files) {
        std::ifstream in(file, std::ios::binary);
        if (!in.is_open()) {
            std::cerr << "Error: Could not read input file " << file << std::endl;
            ++failures;
            continue;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        std::string document = buffer.str();
        try {
            DetectionReport report = detector.scan(document);
            std::cout << file << ": " << report.piiCount << " PII, " << report.spiiCount << " SPII" << std::endl;
            for (Category category : {Category::PII, Category::SPII}) {
                for (const auto& match : detector.findAll(document, category)) {
                    std::cout << "  [" << categoryName(category) << "] @" << match.offset
                              << " \"" << match.text << "\"" << std::endl;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}

void printHelp() {
    std::cout << "dlpmask Command-Line Tool\n";
    std::cout << "Version: " << getDlpmaskVersion() << "\n\n";
    std::cout << "Usage: dlpmask-cli [-test] --file <path> [options]\n";
    std::cout << "       dlpmask-cli [-test] <command> [arguments]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  scan <path>               Reports PII/SPII matches without writing output.\n";
    std::cout << "  version, --version        Display the library version.\n";
    std::cout << "  help                      Show this help message.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --file <path>               File or directory to process.\n";
    std::cout << "  --mode <mode>               tokenize (default), detokenize or redact.\n";
    std::cout << "  --token <literal>           Token used for tokenization (default [TOKEN]).\n";
    std::cout << "  --output <dir>              Directory for output files (default: beside the source).\n";
    std::cout << "  --patterns <file>           Load recognizer patterns from a TOML file.\n";
    std::cout << "  --yes, -y                   Process without confirmation prompts.\n";
    std::cout << "  -test                       Use local data files (for development).\n";
    std::cout << "\nNote: detokenize cannot restore words replaced by tokenize; no mapping\n";
    std::cout << "from tokens back to the original text is kept.\n";
}
