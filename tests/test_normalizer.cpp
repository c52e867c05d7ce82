/*
 * test_normalizer.cpp: tokenizer, lemmatizer and stop-word filter
 */

#include "nlp/LanguageModel.hpp"
#include "nlp/TextNormalizer.hpp"
#include "test_common.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace intentcluster::nlp;

static void test_tokenize() {
  printf("\n--- tokenize ---\n");

  auto tokens = EnglishNormalizer::tokenize("Don't reset my E-mail!");
  std::vector<std::string> expected = {"do", "n't", "reset", "my", "e-mail"};
  ASSERT_EQ(tokens, expected, "contraction split, case folded, hyphen kept");

  tokens = EnglishNormalizer::tokenize("version 3.5, please...");
  expected = {"version", "3.5", "please"};
  ASSERT_EQ(tokens, expected, "decimal kept, trailing dots dropped");

  tokens = EnglishNormalizer::tokenize("it\xE2\x80\x99s done \xE2\x80\x94 thanks");
  expected = {"it", "'s", "done", "thanks"};
  ASSERT_EQ(tokens, expected, "typographic apostrophe folded, dash dropped");

  ASSERT_TRUE(EnglishNormalizer::tokenize("").empty(), "empty text has no tokens");
  ASSERT_TRUE(EnglishNormalizer::tokenize("?!  ,;").empty(), "punctuation only has no tokens");
}

static void test_lemmatize() {
  printf("\n--- lemmatize ---\n");
  LanguageModel model = LanguageModel::english();
  EnglishNormalizer normalizer(model);

  ASSERT_EQ(normalizer.lemmatize("passwords"), "password", "plural s");
  ASSERT_EQ(normalizer.lemmatize("policies"), "policy", "ies -> y");
  ASSERT_EQ(normalizer.lemmatize("processes"), "process", "sses -> ss");
  ASSERT_EQ(normalizer.lemmatize("boxes"), "box", "xes -> x");
  ASSERT_EQ(normalizer.lemmatize("process"), "process", "ss kept");
  ASSERT_EQ(normalizer.lemmatize("status"), "status", "us kept");
  ASSERT_EQ(normalizer.lemmatize("running"), "run", "doubled consonant undone");
  ASSERT_EQ(normalizer.lemmatize("changed"), "change", "silent e restored after ed");
  ASSERT_EQ(normalizer.lemmatize("updating"), "update", "silent e restored after ing");
  ASSERT_EQ(normalizer.lemmatize("went"), "go", "irregular verb");
  ASSERT_EQ(normalizer.lemmatize("children"), "child", "irregular noun");
  ASSERT_EQ(normalizer.lemmatize("news"), "news", "protected word");
  ASSERT_EQ(normalizer.lemmatize("n't"), "not", "clitic expanded");
  ASSERT_EQ(normalizer.lemmatize("3.5"), "3.5", "number verbatim");
  ASSERT_EQ(normalizer.lemmatize("caf\xC3\xA9s"), "caf\xC3\xA9s", "non-ASCII verbatim");
  ASSERT_EQ(normalizer.lemmatize("bus"), "bus", "short word unchanged");
}

static void test_normalize() {
  printf("\n--- normalize ---\n");
  LanguageModel model = LanguageModel::english();
  EnglishNormalizer normalizer(model);

  TokenSequence expected = {"reset", "password"};
  ASSERT_EQ(normalizer.normalize("How do I reset my password?"), expected, "stop words removed");

  expected = {"process", "change", "password"};
  ASSERT_EQ(normalizer.normalize("What is the process to change my password?"), expected,
            "content words in order");

  expected = {"refund"};
  ASSERT_EQ(normalizer.normalize("How can I get a refund?"), expected, "request framing removed");

  expected = {"log"};
  ASSERT_EQ(normalizer.normalize("I can't log in"), expected, "contraction parts removed");

  ASSERT_TRUE(normalizer.normalize("").empty(), "empty utterance");
  ASSERT_TRUE(normalizer.normalize("Is it for you?").empty(), "stop words only");

  auto all = normalizer.normalizeAll({"refunds", "", "passwords"});
  ASSERT_EQ(all.size(), 3u, "one sequence per utterance");
  ASSERT_TRUE(all[1].empty(), "empty utterance keeps its slot");
  ASSERT_EQ(all[2].front(), "password", "batch order preserved");
}

static void test_language_resource() {
  printf("\n--- language resource ---\n");

  LanguageModel custom = LanguageModel::fromJson({
      {"stop_words", nlohmann::json::array({"foo"})},
      {"irregular", {{"geese", "goose"}}},
  });
  ASSERT_TRUE(custom.isStopWord("foo"), "custom stop word");
  ASSERT_FALSE(custom.isStopWord("the"), "standalone resource has no built-in words");
  ASSERT_EQ(custom.irregularLemma("geese"), "goose", "custom irregular form");

  LanguageModel extended = LanguageModel::fromJson({{"extend", true}, {"stop_words", nlohmann::json::array({"foo"})}});
  ASSERT_TRUE(extended.isStopWord("foo"), "extended with custom word");
  ASSERT_TRUE(extended.isStopWord("the"), "extended keeps built-in words");

  EnglishNormalizer normalizer(extended);
  TokenSequence expected = {"bar"};
  ASSERT_EQ(normalizer.normalize("foo bars"), expected, "normalizer uses the loaded resource");

  ASSERT_THROWS(LanguageModel::fromJson(nlohmann::json::array()), std::runtime_error,
                "non-object resource rejected");
  ASSERT_THROWS(LanguageModel::fromJson({{"stop_words", "foo"}}), std::runtime_error,
                "stop_words must be an array");
  ASSERT_THROWS(LanguageModel::fromJson({{"stop_words", nlohmann::json::array({1, 2})}}), std::runtime_error,
                "stop_words must hold strings");
  ASSERT_THROWS(LanguageModel::fromJsonFile("/nonexistent/language.json"), std::runtime_error,
                "missing resource file rejected");
}

static void test_unicode_text() {
  printf("\n--- unicode text ---\n");
  LanguageModel model = LanguageModel::english();
  EnglishNormalizer normalizer(model);

  ASSERT_TRUE(normalizer.normalize("\xC2\xA7 \xC2\xA9").empty(), "section and copyright signs dropped");
  ASSERT_TRUE(normalizer.normalize("\xE3\x80\x82 \xEF\xBC\x81 \xC2\xBF").empty(),
              "CJK, fullwidth and inverted punctuation dropped");

  TokenSequence expected = {"refund", "policy"};
  ASSERT_EQ(normalizer.normalize("\xC2\xABrefund\xC2\xBB policy"), expected, "guillemets stripped from words");

  expected = {"reset", "password"};
  ASSERT_EQ(normalizer.normalize("reset\xC2\xA0password"), expected, "no-break space separates words");
  ASSERT_EQ(normalizer.normalize("reset\xE3\x80\x80password"), expected, "ideographic space separates words");
  ASSERT_EQ(normalizer.normalize("reset\xE2\x80\x8Bpassword"), expected, "zero-width space separates words");

  expected = {"password"};
  ASSERT_EQ(normalizer.normalize("\xC2\xBFpassword\xEF\xBC\x9F"), expected, "punctuation around a word");
  ASSERT_EQ(normalizer.normalize("password \xE3\x80\x82"), expected, "trailing ideographic full stop");

  auto tokens = EnglishNormalizer::tokenize("caf\xC3\xA9 na\xC3\xAFve \xCE\xB1\xCE\xB2");
  std::vector<std::string> words = {"caf\xC3\xA9", "na\xC3\xAFve", "\xCE\xB1\xCE\xB2"};
  ASSERT_EQ(tokens, words, "accented and Greek letters kept");

  tokens = EnglishNormalizer::tokenize("caf\xE9 refund");
  words = {"caf", "refund"};
  ASSERT_EQ(tokens, words, "malformed byte separates words");

  tokens = EnglishNormalizer::tokenize("\xE2\x80\x99quoted\xE2\x80\x99 it\xE2\x80\x99s");
  words = {"quoted", "it", "'s"};
  ASSERT_EQ(tokens, words, "right quote is an apostrophe only inside a word");
}

int main() {
  printf("=== Normalizer Tests ===\n");
  test_tokenize();
  test_lemmatize();
  test_normalize();
  test_language_resource();
  test_unicode_text();
  return report("normalizer");
}
