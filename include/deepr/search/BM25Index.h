//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: BM25Index.h
// Purpose: Tokenizer and BM25 ranking over tokenized documents
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace deepr {
namespace search {

//==========================================================================================================
// Tokenize
// Purpose: Lower-cases text, turns every non-word character into a separator, and keeps tokens longer
//          than two characters. Input is decoded as UTF-8: letters and digits of any script and '_' are
//          word characters, while Unicode punctuation, symbols and spaces separate. Case folding covers
//          Latin, Greek and Cyrillic. Length is measured in code points.
//==========================================================================================================
std::vector<std::string> Tokenize(const std::string& text);

//==========================================================================================================
// BM25Index
// Purpose: Okapi BM25 scoring. Fit() replaces the whole corpus; there is no incremental update.
// Notes:
//   idf(t) = ln((N - df + 0.5) / (df + 0.5) + 1), which stays non-negative for terms present in every
//   document. An empty corpus or an empty query scores every document 0 and never throws.
//==========================================================================================================
class BM25Index {
public:
    static constexpr double kDefaultK1 = 1.5;
    static constexpr double kDefaultB = 0.75;

    explicit BM25Index(double k1 = kDefaultK1, double b = kDefaultB);

    //==========================================================================================================
    // Fit
    // Purpose: Builds document frequencies, lengths, and idf values for the corpus.
    // Args:
    //   corpus: Ordered documents, each a list of tokens.
    //==========================================================================================================
    void Fit(const std::vector<std::vector<std::string>>& corpus);

    //==========================================================================================================
    // GetScores
    // Purpose: Scores every document in corpus order. Query terms unknown to the corpus contribute nothing;
    //          repeated query terms contribute once per occurrence.
    // Returns:
    //   One score per document (empty for an empty corpus).
    //==========================================================================================================
    std::vector<double> GetScores(const std::vector<std::string>& queryTokens) const;

    std::size_t DocumentCount() const { return docLengths_.size(); }
    double AverageDocumentLength() const { return avgDocLength_; }
    std::size_t DocumentFrequency(const std::string& term) const;
    std::optional<double> Idf(const std::string& term) const;

private:
    double k1_;
    double b_;
    std::vector<std::unordered_map<std::string, std::size_t>> termFreqs_;
    std::vector<std::size_t> docLengths_;
    double avgDocLength_{0.0};
    std::unordered_map<std::string, std::size_t> docFreqs_;
    std::unordered_map<std::string, double> idf_;
};

} // namespace search
} // namespace deepr
