#include "StoreSerializer.h"

#include <fstream>
#include <istream>
#include <ostream>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace wicketsim;
using json = nlohmann::json;

namespace {
    const char* const OVERS_KEY = "overs_distribution";
    const char* const RUNS_KEY = "runs_distribution";

    int parseWicketKey(const std::string& key) {
        int wicket = 0;
        try {
            wicket = std::stoi(key);
        }
        catch (const std::logic_error&) {
            throw StoreFormatError("store: wicket key '" + key + "' is not an integer");
        }
        // only the canonical spelling, so "01" or " 1" cannot shadow "1"
        if (key != std::to_string(wicket) || wicket < 1 || wicket > WICKETS_PER_INNINGS)
            throw StoreFormatError("store: wicket key '" + key + "' outside 1.." +
                                   std::to_string(WICKETS_PER_INNINGS));
        return wicket;
    }

    DiscreteDistribution parseDistribution(const json& entry, const char* key, const size_t expected,
                                           const std::string& where) {
        const auto it = entry.find(key);
        if (it == entry.end() || !it->is_array())
            throw StoreFormatError(where + ": missing array '" + key + "'");
        if (it->size() != expected)
            throw StoreFormatError(where + ": '" + key + "' has " + std::to_string(it->size()) +
                                   " entries, expected " + std::to_string(expected));

        std::vector<double> weights;
        weights.reserve(expected);
        for (const auto& v : *it) {
            if (!v.is_number()) throw StoreFormatError(where + ": non-numeric entry in '" + key + "'");
            weights.push_back(v.get<double>());
        }
        try {
            return DiscreteDistribution(std::move(weights));
        }
        catch (const std::invalid_argument& e) {
            throw StoreFormatError(where + ": '" + key + "': " + e.what());
        }
    }
}

void wicketsim::writeStore(const PartnershipStore& store, std::ostream& out) {
    json doc = json::object();
    for (int wicket = 1; wicket <= WICKETS_PER_INNINGS; ++wicket) {
        const auto* stats = store.find(wicket);
        if (!stats) continue;
        doc[std::to_string(wicket)] = {
            {OVERS_KEY, stats->overs.probabilities()},
            {RUNS_KEY, stats->runs.probabilities()}
        };
    }
    out << doc.dump();
}

PartnershipStore wicketsim::readStore(std::istream& in) {
    json doc;
    try {
        doc = json::parse(in);
    }
    catch (const json::parse_error& e) {
        throw StoreFormatError(std::string("store: invalid JSON: ") + e.what());
    }
    if (!doc.is_object()) throw StoreFormatError("store: top level must be an object");

    PartnershipStore store;
    for (const auto& item : doc.items()) {
        const std::string& key = item.key();
        const json& entry = item.value();
        const int wicket = parseWicketKey(key);
        const std::string where = "store wicket " + key;
        if (store.contains(wicket)) throw StoreFormatError(where + ": duplicate entry");
        if (!entry.is_object()) throw StoreFormatError(where + ": entry must be an object");
        if (entry.size() != 2)
            throw StoreFormatError(where + ": expected exactly '" + OVERS_KEY + "' and '" + RUNS_KEY + "'");

        store.set(wicket, PartnershipStatistics(
                      parseDistribution(entry, OVERS_KEY, MAX_PARTNERSHIP_OVERS + 1, where),
                      parseDistribution(entry, RUNS_KEY, MAX_PARTNERSHIP_RUNS + 1, where)));
    }
    return store;
}

void wicketsim::saveStore(const PartnershipStore& store, const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("saveStore: cannot open '" + path + "' for writing");
    writeStore(store, out);
    out.flush();
    if (!out) throw std::runtime_error("saveStore: write to '" + path + "' failed");
    spdlog::info("Saved partnership model ({} wickets) to {}", store.size(), path);
}

PartnershipStore wicketsim::loadStore(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw StoreFormatError("loadStore: cannot open '" + path + "'");
    auto store = readStore(in);
    spdlog::info("Loaded partnership model ({} wickets) from {}", store.size(), path);
    return store;
}
