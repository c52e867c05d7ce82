#pragma once

#include <string>
#include <vector>
#include "nlp/LanguageModel.hpp"

namespace intentcluster {
namespace nlp {

using TokenSequence = std::vector<std::string>;

class ITextNormalizer {
public:
    virtual ~ITextNormalizer() = default;

    // Content lemmas of one utterance, stop words and punctuation removed.
    // Never throws on empty or malformed text, the result may be empty.
    virtual TokenSequence normalize(const std::string& text) const = 0;

    // Normalize a whole batch, one sequence per utterance in input order
    std::vector<TokenSequence> normalizeAll(const std::vector<std::string>& texts) const;
};

/**
 * Rule-based English normalizer: tokenizer, suffix lemmatizer and
 * stop-word filter driven by a LanguageModel.
 */
class EnglishNormalizer : public ITextNormalizer {
public:
    // The model must outlive the normalizer
    explicit EnglishNormalizer(const LanguageModel& model);

    TokenSequence normalize(const std::string& text) const override;

    // Lower-cased word tokens with contractions split off ("don't" -> "do", "n't").
    // Unicode spaces, punctuation and symbols separate tokens and never form one;
    // non-ASCII letters are kept as they are.
    static std::vector<std::string> tokenize(const std::string& text);

    // Dictionary form of a lower-cased token
    std::string lemmatize(const std::string& token) const;

private:
    const LanguageModel& model_;

    static std::string stripSuffixRules(const std::string& word);
    static std::string restoreStem(const std::string& stem);
};

} // namespace nlp
} // namespace intentcluster
