#include <algorithm>
#include <fstream>

#include <gtest/gtest.h>

#include "embedding.hpp"
#include "test_util.hpp"

namespace {

EmbedOpt small_opt(int dim = 8)
{
    EmbedOpt o;
    o.dim    = dim;
    o.epochs = 2;
    o.bucket = 1000;
    return o;
}

const std::vector<std::string> kCorpus = {
    "how do i learn english [SEP] best way to learn english",
    "what is the capital of france [SEP] population of germany",
    "how to lose weight fast [SEP] ways to lose weight quickly",
};

} // namespace

TEST(EmbeddingTest, TokenizeLowercasesAndSplitsOnWhitespace)
{
    auto t = tokenize("  Hello\tWORLD \n [SEP]  x ");
    EXPECT_EQ(t, (std::vector<std::string>{"hello", "world", "[sep]", "x"}));
    EXPECT_TRUE(tokenize("   ").empty());
}

TEST(EmbeddingTest, SubwordIdsRespectRangeAndBucket)
{
    auto ids = subword_ids("where", 3, 6, 100);
    EXPECT_FALSE(ids.empty());
    for (int id : ids) {
        EXPECT_GE(id, 0);
        EXPECT_LT(id, 100);
    }
    /* "<where>" has 7 chars: 5 + 4 + 3 + 2 n-grams of length 3..6 */
    EXPECT_EQ(ids.size(), 14u);
    EXPECT_TRUE(subword_ids("where", 3, 0, 100).empty());
}

TEST(EmbeddingTest, VocabularyIsExactlyTrainingTokens)
{
    EmbedOpt o = small_opt(4);
    EmbeddingModel m = train_embedding({"a b", "c d"}, o);

    EXPECT_EQ(m.vocab_size(), 4u);
    EXPECT_EQ(m.dim(), 4);
    auto v = m.vocabulary();
    std::sort(v.begin(), v.end());
    EXPECT_EQ(v, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST(EmbeddingTest, MinCountDropsRareTokens)
{
    EmbedOpt o = small_opt();
    o.min_count = 2;
    EmbeddingModel m = train_embedding({"x y", "x z"}, o);
    EXPECT_EQ(m.vocab_size(), 1u);
    EXPECT_TRUE(m.contains("x"));
    EXPECT_EQ(m.index("y"), -1);
}

TEST(EmbeddingTest, TrainingIsDeterministic)
{
    EmbedOpt o = small_opt();
    EmbeddingModel a = train_embedding(kCorpus, o);
    EmbeddingModel b = train_embedding(kCorpus, o);
    ASSERT_EQ(a.vocabulary(), b.vocabulary());
    EXPECT_TRUE(a.vectors().isApprox(b.vectors()));

    FeatVec va = vectorize(kCorpus[0], a);
    FeatVec vb = vectorize(kCorpus[0], a);
    EXPECT_TRUE(va == vb);
}

TEST(EmbeddingTest, AllOovOrEmptyTextGivesZeroVector)
{
    EmbeddingModel m = train_embedding(kCorpus, small_opt(6));
    FeatVec oov = vectorize("zzz qqq", m);
    ASSERT_EQ(oov.size(), 6);
    EXPECT_TRUE(oov.isZero());
    EXPECT_TRUE(vectorize("", m).isZero());
}

TEST(EmbeddingTest, VectorIsMeanOfKnownTokens)
{
    EmbeddingModel m = train_embedding(kCorpus, small_opt());
    const int i = m.index("english");
    const int j = m.index("france");
    ASSERT_GE(i, 0);
    ASSERT_GE(j, 0);

    FeatVec expect = 0.5f * (m.vectors().row(i) + m.vectors().row(j)).transpose();
    FeatVec got    = vectorize("English unknownword FRANCE", m);
    EXPECT_TRUE(got.isApprox(expect, 1e-5f));
}

TEST(EmbeddingTest, EvaluationTextNeverEntersVocabulary)
{
    EmbeddingModel m = train_embedding(kCorpus, small_opt());
    EXPECT_FALSE(m.contains("zebra"));
    EXPECT_TRUE(vectorize("zebra", m).isZero());
}

TEST(EmbeddingTest, VectorizeAllMatchesRowByRow)
{
    EmbeddingModel m = train_embedding(kCorpus, small_opt());
    FeatMat X = vectorize_all(kCorpus, m);
    ASSERT_EQ(X.rows(), 3);
    ASSERT_EQ(X.cols(), 8);
    for (int r = 0; r < 3; ++r)
        EXPECT_TRUE(X.row(r).transpose().isApprox(vectorize(kCorpus[size_t(r)], m)));
}

TEST(EmbeddingTest, BadOptionsThrowInvalidInput)
{
    EmbedOpt o = small_opt();
    o.dim = 0;
    EXPECT_THROW(train_embedding(kCorpus, o), InvalidInput);

    o = small_opt();
    o.window = 0;
    EXPECT_THROW(train_embedding(kCorpus, o), InvalidInput);

    o = small_opt();
    o.min_count = 0;
    EXPECT_THROW(train_embedding(kCorpus, o), InvalidInput);

    o = small_opt();
    o.min_n = 5;
    o.max_n = 3;
    EXPECT_THROW(train_embedding(kCorpus, o), InvalidInput);
}

TEST(EmbeddingTest, SaveVecWritesHeaderAndRows)
{
    EmbeddingModel m = train_embedding({"a b", "c d"}, small_opt(4));
    const std::string p = ::testing::TempDir() + "emb.vec";
    m.save_vec(p);

    std::ifstream in(p);
    size_t V = 0;
    int    D = 0;
    in >> V >> D;
    EXPECT_EQ(V, 4u);
    EXPECT_EQ(D, 4);
    std::string word;
    float x = 0;
    size_t rows = 0;
    while (in >> word) {
        for (int d = 0; d < D; ++d) ASSERT_TRUE(bool(in >> x));
        ++rows;
    }
    EXPECT_EQ(rows, 4u);
}
