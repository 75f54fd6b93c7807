#include "CricsheetReader.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace wicketsim;
using json = nlohmann::json;

namespace {
    InningsRecord readInnings(const json& innings) {
        if (!innings.is_object()) throw std::runtime_error("Cricsheet: innings entry is not an object");
        InningsRecord record;
        const auto overs = innings.find("overs");
        if (overs == innings.end()) return record;   // forfeited / not started

        for (const auto& over : *overs) {
            const auto deliveries = over.find("deliveries");
            if (deliveries == over.end()) continue;
            for (const auto& ball : *deliveries) {
                Delivery d;
                d.runs = ball.at("runs").at("total").get<int>();
                const auto wickets = ball.find("wickets");
                if (wickets != ball.end()) d.wickets = static_cast<int>(wickets->size());
                record.deliveries.push_back(d);
            }
        }
        return record;
    }
}

std::vector<InningsRecord> wicketsim::readCricsheetMatch(std::istream& in) {
    std::vector<InningsRecord> out;
    try {
        const json doc = json::parse(in);
        if (!doc.is_object()) throw std::runtime_error("Cricsheet: document is not an object");
        const auto innings = doc.find("innings");
        if (innings == doc.end()) return out;
        if (!innings->is_array()) throw std::runtime_error("Cricsheet: 'innings' is not an array");
        for (const auto& inn : *innings)
            out.push_back(readInnings(inn));
    }
    catch (const json::exception& e) {
        throw std::runtime_error(std::string("Cricsheet: ") + e.what());
    }
    return out;
}

std::vector<InningsRecord> wicketsim::loadCorpus(const std::vector<std::string>& paths) {
    std::vector<InningsRecord> corpus;
    size_t skipped = 0;

    for (size_t i = 0; i < paths.size(); ++i) {
        if (i % 100 == 0) spdlog::info("Processing match {}/{}...", i + 1, paths.size());

        std::ifstream in(paths[i]);
        if (!in) {
            spdlog::warn("Skipping {}: cannot open", paths[i]);
            ++skipped;
            continue;
        }
        try {
            auto innings = readCricsheetMatch(in);
            std::move(innings.begin(), innings.end(), std::back_inserter(corpus));
        }
        catch (const std::runtime_error& e) {
            spdlog::warn("Skipping {}: {}", paths[i], e.what());
            ++skipped;
        }
    }

    spdlog::info("Loaded {} innings from {} files ({} skipped)", corpus.size(), paths.size() - skipped, skipped);
    return corpus;
}

std::vector<InningsRecord> wicketsim::loadCorpusDirectory(const std::string& directory) {
    namespace fs = std::filesystem;
    if (!fs::is_directory(directory))
        throw std::runtime_error("loadCorpusDirectory: '" + directory + "' is not a directory");

    std::vector<std::string> paths;
    for (const auto& entry : fs::directory_iterator(directory))
        if (entry.is_regular_file() && entry.path().extension() == ".json")
            paths.push_back(entry.path().string());
    std::sort(paths.begin(), paths.end());
    return loadCorpus(paths);
}
