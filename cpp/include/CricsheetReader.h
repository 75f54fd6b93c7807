#pragma once
/**
 * @file CricsheetReader.h
 * @brief Reads historical innings from Cricsheet JSON match files.
 */
#include <iosfwd>
#include <string>
#include <vector>

#include "InningsRecord.h"

namespace wicketsim {
    /**
     * @brief Every innings of one match document.
     *
     * Uses innings[].overs[].deliveries[], taking runs.total as the runs off each ball and the
     * length of the optional wickets array as the wickets that fell on it.
     * @throws std::runtime_error if the document is not valid JSON or lacks the expected fields
     */
    std::vector<InningsRecord> readCricsheetMatch(std::istream& in);

    /**
     * @brief Innings from a list of files, in order.
     *
     * A file that cannot be opened or parsed is logged and skipped.
     */
    std::vector<InningsRecord> loadCorpus(const std::vector<std::string>& paths);

    /**
     * @brief Innings from every *.json file in a directory, in file-name order.
     * @throws std::runtime_error if the directory does not exist
     */
    std::vector<InningsRecord> loadCorpusDirectory(const std::string& directory);
}
