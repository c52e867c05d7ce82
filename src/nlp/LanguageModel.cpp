#include "nlp/LanguageModel.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace intentcluster {
namespace nlp {

namespace {

// Function words plus the request framing that carries no intent on its own
// ("can you help me", "tell me about", "i want to get")
const char* const kEnglishStopWords[] = {
    "a", "about", "above", "across", "after", "afterwards", "again", "against",
    "all", "almost", "alone", "along", "already", "also", "although", "always",
    "am", "among", "amongst", "an", "and", "another", "any", "anyhow", "anyone",
    "anything", "anyway", "anywhere", "are", "around", "as", "at", "be",
    "became", "because", "become", "becomes", "becoming", "been", "before",
    "beforehand", "behind", "being", "below", "beside", "besides", "between",
    "beyond", "both", "but", "by", "can", "cannot", "could", "did", "do",
    "does", "doing", "done", "down", "due", "during", "each", "either", "else",
    "elsewhere", "enough", "even", "ever", "every", "everyone", "everything",
    "everywhere", "except", "few", "for", "former", "formerly", "from",
    "further", "had", "has", "have", "having", "he", "hence", "her", "here",
    "hereafter", "hereby", "herein", "hereupon", "hers", "herself", "him",
    "himself", "his", "how", "however", "hundred", "i", "if", "in", "indeed",
    "into", "is", "it", "its", "itself", "just", "latter", "latterly", "least",
    "less", "may", "me", "meanwhile", "might", "mine", "more", "moreover",
    "most", "mostly", "much", "must", "my", "myself", "namely", "neither",
    "never", "nevertheless", "no", "nobody", "none", "noone", "nor", "not",
    "nothing", "now", "nowhere", "of", "off", "often", "on", "once", "only",
    "onto", "or", "other", "others", "otherwise", "our", "ours", "ourselves",
    "out", "over", "own", "per", "perhaps", "quite", "rather", "really", "same",
    "several", "she", "should", "since", "so", "some", "somehow", "someone",
    "something", "sometime", "sometimes", "somewhere", "still", "such", "than",
    "that", "the", "their", "theirs", "them", "themselves", "then", "thence",
    "there", "thereafter", "thereby", "therefore", "therein", "thereupon",
    "these", "they", "this", "those", "though", "through", "throughout", "thru",
    "thus", "to", "together", "too", "toward", "towards", "under", "unless",
    "until", "up", "upon", "us", "very", "via", "was", "we", "well", "were",
    "what", "whatever", "when", "whence", "whenever", "where", "whereafter",
    "whereas", "whereby", "wherein", "whereupon", "wherever", "whether",
    "which", "while", "whither", "who", "whoever", "whole", "whom", "whose",
    "why", "will", "with", "within", "without", "would", "yet", "you", "your",
    "yours", "yourself", "yourselves", "yes", "ok", "okay", "hi", "hello",
    "hey", "shall", "'s", "'re", "'ve", "'ll", "'m", "'d",
    // request framing
    "please", "help", "tell", "want", "need", "get", "let", "know", "like",
    "thank", "thanks", "able", "possible", "way",
};

const std::pair<const char*, const char*> kEnglishIrregular[] = {
    {"am", "be"}, {"is", "be"}, {"are", "be"}, {"was", "be"}, {"were", "be"},
    {"been", "be"}, {"being", "be"},
    {"has", "have"}, {"had", "have"}, {"having", "have"},
    {"does", "do"}, {"did", "do"}, {"done", "do"}, {"doing", "do"},
    {"goes", "go"}, {"went", "go"}, {"gone", "go"}, {"going", "go"},
    {"got", "get"}, {"gotten", "get"},
    {"made", "make"}, {"making", "make"},
    {"said", "say"}, {"says", "say"},
    {"saw", "see"}, {"seen", "see"},
    {"took", "take"}, {"taken", "take"},
    {"gave", "give"}, {"given", "give"},
    {"knew", "know"}, {"known", "know"},
    {"came", "come"}, {"found", "find"}, {"thought", "think"},
    {"told", "tell"}, {"bought", "buy"}, {"paid", "pay"}, {"sent", "send"},
    {"lost", "lose"}, {"forgot", "forget"}, {"forgotten", "forget"},
    {"ran", "run"}, {"wrote", "write"}, {"written", "write"},
    {"began", "begin"}, {"begun", "begin"}, {"chose", "choose"},
    {"chosen", "choose"}, {"broke", "break"}, {"broken", "break"},
    {"spoke", "speak"}, {"spoken", "speak"}, {"felt", "feel"},
    {"kept", "keep"}, {"held", "hold"}, {"brought", "bring"},
    {"spent", "spend"}, {"built", "build"}, {"understood", "understand"},
    {"using", "use"}, {"used", "use"}, {"writing", "write"},
    {"cancelled", "cancel"}, {"cancelling", "cancel"}, {"travelled", "travel"},
    {"children", "child"}, {"men", "man"}, {"women", "woman"},
    {"feet", "foot"}, {"teeth", "tooth"}, {"mice", "mouse"},
    {"better", "good"}, {"best", "good"}, {"worse", "bad"}, {"worst", "bad"},
    {"ca", "can"}, {"wo", "will"}, {"sha", "shall"},
    // words the suffix rules would damage
    {"news", "news"}, {"series", "series"}, {"species", "species"},
    {"thing", "thing"}, {"morning", "morning"}, {"evening", "evening"},
    {"ceiling", "ceiling"}, {"wedding", "wedding"}, {"king", "king"},
    {"ring", "ring"}, {"sing", "sing"}, {"bring", "bring"},
    {"spring", "spring"}, {"string", "string"}, {"swing", "swing"},
    {"wing", "wing"}, {"nothing", "nothing"}, {"something", "something"},
    {"anything", "anything"}, {"everything", "everything"},
    {"during", "during"}, {"bed", "bed"}, {"red", "red"}, {"need", "need"},
    {"speed", "speed"}, {"feed", "feed"}, {"seed", "seed"},
};

const std::pair<const char*, const char*> kEnglishContractions[] = {
    {"n't", "not"}, {"'re", "be"}, {"'ve", "have"}, {"'ll", "will"},
    {"'m", "be"}, {"'d", "would"}, {"'s", "'s"},
};

} // namespace

LanguageModel LanguageModel::english() {
    LanguageModel model;
    for (const char* word : kEnglishStopWords) {
        model.stopWords_.insert(word);
    }
    for (const auto& [form, lemma] : kEnglishIrregular) {
        model.irregular_.emplace(form, lemma);
    }
    for (const auto& [clitic, expansion] : kEnglishContractions) {
        model.contractions_.emplace(clitic, expansion);
    }
    return model;
}

void LanguageModel::merge(const nlohmann::json& j) {
    if (j.contains("stop_words")) {
        if (!j["stop_words"].is_array()) {
            throw std::runtime_error("'stop_words' must be an array of strings");
        }
        for (const auto& word : j["stop_words"]) {
            stopWords_.insert(word.get<std::string>());
        }
    }

    if (j.contains("irregular")) {
        if (!j["irregular"].is_object()) {
            throw std::runtime_error("'irregular' must be an object of form -> lemma");
        }
        for (const auto& [form, lemma] : j["irregular"].items()) {
            irregular_.insert_or_assign(form, lemma.get<std::string>());
        }
    }

    if (j.contains("contractions")) {
        if (!j["contractions"].is_object()) {
            throw std::runtime_error("'contractions' must be an object of clitic -> expansion");
        }
        for (const auto& [clitic, expansion] : j["contractions"].items()) {
            contractions_.insert_or_assign(clitic, expansion.get<std::string>());
        }
    }
}

LanguageModel LanguageModel::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Language resource must be a JSON object");
    }

    LanguageModel model = j.value("extend", false) ? english() : LanguageModel();
    try {
        model.merge(j);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(std::string("Invalid language resource: ") + e.what());
    }
    return model;
}

LanguageModel LanguageModel::fromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open language resource: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("JSON parse error in " + path + ": " + e.what());
    }

    LanguageModel model = fromJson(j);
    std::cout << "Loaded language resource " << path << " (" << model.stopWordCount()
              << " stop words, " << model.irregularCount() << " irregular forms)" << std::endl;
    return model;
}

bool LanguageModel::isStopWord(const std::string& word) const {
    return stopWords_.count(word) > 0;
}

std::string LanguageModel::irregularLemma(const std::string& word) const {
    auto it = irregular_.find(word);
    return it != irregular_.end() ? it->second : std::string();
}

std::string LanguageModel::expandContraction(const std::string& clitic) const {
    auto it = contractions_.find(clitic);
    return it != contractions_.end() ? it->second : std::string();
}

} // namespace nlp
} // namespace intentcluster
