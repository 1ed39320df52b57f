// reefradar: command-line front end for the acoustic health engine
#include "reefradar/EngineConfig.h"
#include "reefradar/Errors.h"
#include "reefradar/Log.h"
#include "reefradar/ReefEngine.h"
#include "reefradar/Utility.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitAnalysisFailed = 2;

void print_usage() {
    std::cerr << "usage:\n"
              << "  reefradar analyze <file.wav> [--db PATH] [--top-k N] [--processed-out PATH]\n"
              << "  reefradar add-site --db PATH --id ID --country C --category CAT <file.wav>\n"
              << "  reefradar remove-site --db PATH --id ID\n"
              << "  reefradar list-sites --db PATH\n"
              << "\n"
              << "CAT is one of healthy, degraded, restored_early, restored_mid.\n"
              << "REEFRADAR_LOG_LEVEL=debug|info|warn|error|off controls diagnostics on stderr.\n";
}

struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    bool has(const std::string& key) const { return options.count(key) > 0; }

    std::string get(const std::string& key) const {
        auto it = options.find(key);
        return it == options.end() ? std::string() : it->second;
    }

    std::string require(const std::string& key) const {
        auto it = options.find(key);
        if (it == options.end() || it->second.empty()) {
            throw std::runtime_error("missing required option --" + key);
        }
        return it->second;
    }
};

// Every option takes a value: "--key value".
Arguments parse_arguments(int argc, char** argv, int first) {
    Arguments args;
    for (int i = first; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                throw std::runtime_error("option " + token + " requires a value");
            }
            args.options[token.substr(2)] = argv[++i];
        } else {
            args.positional.push_back(std::move(token));
        }
    }
    return args;
}

std::vector<std::uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write " + path);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("failed writing " + path);
    }
}

std::size_t parse_positive(const std::string& name, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size() || parsed == 0 || value.find('-') != std::string::npos) {
        throw std::runtime_error("--" + name + " expects a positive integer, got '" + value + "'");
    }
    return static_cast<std::size_t>(parsed);
}

void print_result(const reefradar::AnalysisResult& r) {
    using reefradar::category_to_string;

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "status:      complete\n";
    std::cout << "label:       " << category_to_string(r.classification.label) << "\n";
    std::cout << "confidence:  " << r.classification.confidence << "\n";
    std::cout << "probabilities:\n";
    for (const auto& p : r.classification.probabilities) {
        std::cout << "  " << std::left << std::setw(15) << category_to_string(p.category) << std::right
                  << p.probability << "\n";
    }
    std::cout << "similar sites:\n";
    for (const auto& s : r.similarSites) {
        std::cout << "  " << s.siteId << " (" << s.country << ", " << category_to_string(s.category)
                  << ") " << s.similarity << "\n";
    }
    std::cout << "projection:  (" << r.visualization.query.x << ", " << r.visualization.query.y << ")\n";
    for (const auto& point : r.visualization.referencePoints) {
        std::cout << "  " << point.siteId << " (" << point.position.x << ", " << point.position.y << ")\n";
    }
    std::cout << std::setprecision(2);
    std::cout << "audio:       " << r.originalSampleRate << " Hz, " << r.originalChannels << " ch, "
              << r.originalBitDepth << "-bit, " << r.originalDurationSeconds << " s native, "
              << r.processedDurationSeconds << " s processed, " << r.windowCount << " window(s)\n";
    std::cout << "embedding:   " << r.embedding.dimension << " dims, " << r.embedding.aggregation << " of "
              << r.embedding.windowCount << (r.embedding.synthetic ? ", synthetic" : "") << "\n";
    if (r.classification.placeholder) {
        std::cout << "note:        no reference sites loaded; placeholder results\n";
    }
    std::cout << "caveats:     " << r.caveats << "\n";
    std::cout << "completed:   " << r.completedAt << "\n";
}

int run_analyze(const Arguments& args) {
    if (args.positional.size() != 1) {
        print_usage();
        return kExitError;
    }

    reefradar::EngineConfig config = reefradar::EngineConfig::from_environment();
    if (args.has("db")) config.databasePath = args.get("db");
    if (args.has("top-k")) config.topK = parse_positive("top-k", args.get("top-k"));

    const std::string& path = args.positional.front();
    reefradar::AnalysisRequest request;
    request.analysisId = std::filesystem::path(path).stem().string() + "-" + reefradar::utc_timestamp_now();
    request.uploadId = path;
    request.audioBytes = read_file(path);
    if (args.has("processed-out")) request.options |= reefradar::AnalyzeEmitProcessedAudio;

    reefradar::ReefEngine engine(config);
    const reefradar::AnalysisOutcome outcome = engine.analyze(request);
    if (!outcome.complete()) {
        std::cout << "status:      failed\n";
        std::cout << "error:       " << reefradar::error_code_to_string(outcome.error.code) << "\n";
        std::cout << "message:     " << outcome.error.message << "\n";
        return kExitAnalysisFailed;
    }

    print_result(outcome.result);
    if (args.has("processed-out")) {
        write_file(args.get("processed-out"), outcome.result.processedAudio);
    }
    return kExitOk;
}

int run_add_site(const Arguments& args) {
    if (args.positional.size() != 1) {
        print_usage();
        return kExitError;
    }

    reefradar::EngineConfig config;
    config.databasePath = args.require("db");

    reefradar::ReferenceSite site;
    site.siteId = args.require("id");
    site.country = args.require("country");
    site.category = reefradar::category_from_string(args.require("category"));

    reefradar::ReefEngine engine(config);
    const reefradar::RecordingEmbedding rec = engine.embed_recording(read_file(args.positional.front()));
    site.meanEmbedding = rec.mean;
    engine.store()->upsert_reference_site(site);

    std::cout << "stored " << site.siteId << " (" << reefradar::category_to_string(site.category) << ", "
              << rec.mean.size() << " dims from " << rec.windowCount << " window(s)"
              << (rec.synthetic ? ", synthetic" : "") << ")\n";
    return kExitOk;
}

int run_remove_site(const Arguments& args) {
    reefradar::ReferenceStore store(args.require("db"));
    store.initialize();
    const std::string id = args.require("id");
    if (!store.remove_reference_site(id)) {
        std::cerr << "no reference site " << id << "\n";
        return kExitError;
    }
    std::cout << "removed " << id << "\n";
    return kExitOk;
}

int run_list_sites(const Arguments& args) {
    reefradar::ReferenceStore store(args.require("db"));
    store.initialize();
    const reefradar::Corpus corpus = store.load_reference_sites();
    for (const auto& site : corpus) {
        std::cout << site.siteId << "\t" << site.country << "\t" << reefradar::category_to_string(site.category)
                  << "\t" << site.meanEmbedding.size() << "\n";
    }
    std::cout << corpus.size() << " reference site(s)\n";
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    reefradar::log::init_from_environment();

    if (argc < 2) {
        print_usage();
        return kExitError;
    }

    const std::string command = argv[1];
    try {
        const Arguments args = parse_arguments(argc, argv, 2);
        if (command == "analyze") return run_analyze(args);
        if (command == "add-site") return run_add_site(args);
        if (command == "remove-site") return run_remove_site(args);
        if (command == "list-sites") return run_list_sites(args);
        if (command == "--help" || command == "-h" || command == "help") {
            print_usage();
            return kExitOk;
        }
        std::cerr << "unknown command: " << command << "\n";
        print_usage();
        return kExitError;
    } catch (const reefradar::ReefError& e) {
        std::cerr << "error: " << reefradar::error_code_to_string(e.code()) << ": " << e.what() << "\n";
        return reefradar::is_user_error(e.code()) ? kExitAnalysisFailed : kExitError;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return kExitError;
    }
}
