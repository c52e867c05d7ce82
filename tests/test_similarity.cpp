/*
 * test_similarity.cpp: sparse cosine similarity matrix
 */

#include "embedding/Similarity.hpp"
#include "test_common.hpp"

using namespace intentcluster;

int main() {
  printf("=== Similarity Tests ===\n");

  auto batch = TfidfVectorizer::fitTransform({{"a", "b"}, {"b", "a"}, {"c"}, {}, {"a", "c"}});
  SimilarityMatrix sim = SimilarityEngine::compute(batch.vectors);

  ASSERT_EQ(sim.size(), 5u, "square matrix rows");
  ASSERT_EQ(sim[0].size(), 5u, "square matrix columns");

  bool symmetric = true;
  for (size_t i = 0; i < sim.size(); ++i) {
    for (size_t j = 0; j < sim.size(); ++j) {
      if (sim[i][j] != sim[j][i]) symmetric = false;
    }
  }
  ASSERT_TRUE(symmetric, "matrix is symmetric");

  ASSERT_NEAR(sim[0][0], 1.0, 1e-12, "diagonal is 1 for non-zero rows");
  ASSERT_NEAR(sim[2][2], 1.0, 1e-12, "diagonal is 1 for single-term rows");
  ASSERT_NEAR(sim[3][3], 0.0, 1e-12, "diagonal is 0 for the zero vector");
  ASSERT_NEAR(sim[0][3], 0.0, 1e-12, "zero vector scores 0 against others");
  ASSERT_NEAR(sim[0][1], 1.0, 1e-12, "same terms in any order");
  ASSERT_NEAR(sim[0][2], 0.0, 1e-12, "disjoint terms");
  ASSERT_TRUE(sim[0][4] > 0.0 && sim[0][4] < 1.0, "partial overlap");

  ASSERT_NEAR(SimilarityEngine::dotSparse({{0, 0.6}, {2, 0.8}}, {{1, 1.0}, {2, 0.5}}), 0.4, 1e-12,
              "merge-join dot product");
  ASSERT_NEAR(SimilarityEngine::dotSparse({}, {{1, 1.0}}), 0.0, 1e-12, "empty operand");

  ASSERT_TRUE(SimilarityEngine::compute({}).empty(), "empty batch");

  return report("similarity");
}
