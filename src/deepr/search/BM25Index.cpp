//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: BM25Index.cpp
// Purpose: Tokenizer and BM25 scoring implementation
//==========================================================================================================

#include <cctype>
#include <cmath>

#include "deepr/search/BM25Index.h"

namespace deepr {
namespace search {

namespace {

// Decodes the UTF-8 sequence at s[i] and advances i. A malformed sequence yields its lead byte with
// valid == false so the caller can keep the raw byte.
char32_t decodeAt(const std::string& s, std::size_t& i, bool& valid) {
    const unsigned char lead = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
        valid = true;
        ++i;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    }
    if (len == 0 || i + len > s.size()) {
        valid = false;
        ++i;
        return lead;
    }
    for (std::size_t k = 1; k < len; ++k) {
        const unsigned char c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) {
            valid = false;
            ++i;
            return lead;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    valid = true;
    i += len;
    return cp;
}

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Letters, digits and '_'. Non-ASCII code points count as letters except the punctuation, symbol
// and space blocks below.
bool isWordCodePoint(char32_t cp) {
    if (cp < 0x80) {
        return std::isalnum(static_cast<unsigned char>(cp)) != 0 || cp == '_';
    }
    if (cp < 0xC0) {
        switch (cp) {
            case 0xAA: case 0xB2: case 0xB3: case 0xB5: case 0xB9: case 0xBA: case 0xBC: case 0xBD: case 0xBE:
                return true;
            default:
                return false;
        }
    }
    if (cp == 0xD7 || cp == 0xF7) return false;
    if (cp >= 0x2000 && cp <= 0x206F) return false;   // general punctuation and spaces
    if (cp >= 0x20A0 && cp <= 0x20CF) return false;   // currency
    if (cp >= 0x2190 && cp <= 0x23FF) return false;   // arrows, math operators, technical
    if (cp >= 0x2500 && cp <= 0x27BF) return false;   // box drawing, shapes, dingbats
    if (cp >= 0x2900 && cp <= 0x2BFF) return false;
    if (cp >= 0x2E00 && cp <= 0x2E7F) return false;
    if ((cp >= 0x3000 && cp <= 0x3004) || (cp >= 0x3008 && cp <= 0x3020) || cp == 0x3030) return false;
    if (cp >= 0xFE10 && cp <= 0xFE6F) return false;
    if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
        (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65)) return false;
    if (cp >= 0x1F000 && cp <= 0x1FAFF) return false; // emoji and pictographs
    return true;
}

// Lowercases ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic capitals.
char32_t foldCase(char32_t cp) {
    if (cp < 0x80) {
        return static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
    }
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x178) return 0xFF;
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;
    if (cp == 0x386) return 0x3AC;
    if (cp >= 0x388 && cp <= 0x38A) return cp + 0x25;
    if (cp == 0x38C) return 0x3CC;
    if (cp == 0x38E || cp == 0x38F) return cp + 0x3F;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    return cp;
}

std::size_t codePointCount(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

} // namespace

std::vector<std::string> Tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (codePointCount(current) > 2) {
            tokens.push_back(current);
        }
        current.clear();
    };
    std::size_t i = 0;
    while (i < text.size()) {
        bool valid = true;
        const char32_t cp = decodeAt(text, i, valid);
        if (!valid) {
            current.push_back(static_cast<char>(cp));
        } else if (isWordCodePoint(cp)) {
            appendUtf8(current, foldCase(cp));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

BM25Index::BM25Index(double k1, double b) : k1_(k1), b_(b) {}

void BM25Index::Fit(const std::vector<std::vector<std::string>>& corpus) {
    termFreqs_.clear();
    docLengths_.clear();
    docFreqs_.clear();
    idf_.clear();
    avgDocLength_ = 0.0;
    if (corpus.empty()) {
        return;
    }

    std::size_t totalLength = 0;
    termFreqs_.reserve(corpus.size());
    docLengths_.reserve(corpus.size());
    for (const auto& doc : corpus) {
        std::unordered_map<std::string, std::size_t> tf;
        for (const auto& token : doc) {
            ++tf[token];
        }
        for (const auto& [token, count] : tf) {
            ++docFreqs_[token];
        }
        termFreqs_.push_back(std::move(tf));
        docLengths_.push_back(doc.size());
        totalLength += doc.size();
    }
    const double n = static_cast<double>(corpus.size());
    avgDocLength_ = static_cast<double>(totalLength) / n;

    for (const auto& [token, df] : docFreqs_) {
        const double d = static_cast<double>(df);
        idf_[token] = std::log((n - d + 0.5) / (d + 0.5) + 1.0);
    }
}

std::vector<double> BM25Index::GetScores(const std::vector<std::string>& queryTokens) const {
    std::vector<double> scores(docLengths_.size(), 0.0);
    if (docLengths_.empty() || queryTokens.empty()) {
        return scores;
    }
    for (std::size_t idx = 0; idx < docLengths_.size(); ++idx) {
        const auto& tf = termFreqs_[idx];
        const double docLen = static_cast<double>(docLengths_[idx]);
        double score = 0.0;
        for (const auto& token : queryTokens) {
            auto idfIt = idf_.find(token);
            if (idfIt == idf_.end()) {
                continue;
            }
            auto tfIt = tf.find(token);
            const double f = (tfIt == tf.end()) ? 0.0 : static_cast<double>(tfIt->second);
            const double numerator = f * (k1_ + 1.0);
            const double denominator = (avgDocLength_ > 0.0)
                ? f + k1_ * (1.0 - b_ + b_ * docLen / avgDocLength_)
                : f + k1_;
            if (denominator > 0.0) {
                score += idfIt->second * (numerator / denominator);
            }
        }
        scores[idx] = score;
    }
    return scores;
}

std::size_t BM25Index::DocumentFrequency(const std::string& term) const {
    auto it = docFreqs_.find(term);
    return it == docFreqs_.end() ? 0 : it->second;
}

std::optional<double> BM25Index::Idf(const std::string& term) const {
    auto it = idf_.find(term);
    if (it == idf_.end()) return std::nullopt;
    return it->second;
}

} // namespace search
} // namespace deepr
