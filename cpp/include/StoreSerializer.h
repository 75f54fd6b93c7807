#pragma once
/**
 * @file StoreSerializer.h
 * @brief JSON persistence for PartnershipStore.
 *
 * Layout: {"1": {"overs_distribution": [101 numbers], "runs_distribution": [301 numbers]}, ...}
 * with one entry per wicket index that holds statistics.
 */
#include <iosfwd>
#include <stdexcept>
#include <string>

#include "PartnershipStatistics.h"

namespace wicketsim {
    /**
     * @brief A persisted store could not be read back.
     */
    class StoreFormatError : public std::runtime_error {
    public:
        explicit StoreFormatError(const std::string& what) : std::runtime_error(what) {}
    };

    /** @brief Serialize to a stream; doubles are written in shortest round-trip form. */
    void writeStore(const PartnershipStore& store, std::ostream& out);

    /**
     * @brief Parse a store from a stream.
     * @throws StoreFormatError on malformed JSON, unknown keys, wrong lengths or invalid weights
     */
    PartnershipStore readStore(std::istream& in);

    /**
     * @brief Write the store to a file, replacing it.
     * @throws std::runtime_error if the file cannot be written
     */
    void saveStore(const PartnershipStore& store, const std::string& path);

    /**
     * @brief Read a store from a file.
     * @throws StoreFormatError if the file cannot be opened or parsed
     */
    PartnershipStore loadStore(const std::string& path);
}
