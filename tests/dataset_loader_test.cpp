#include <gtest/gtest.h>

#include "dataset_loader.hpp"
#include "test_util.hpp"

TEST(DatasetLoaderTest, LoadsValidPairs)
{
    const std::string p = write_tmp("qqp_ok.tsv",
        "id\tqid1\tqid2\tquestion1\tquestion2\tis_duplicate\n"
        "0\t1\t2\tHow old are you?\tWhat is your age?\t1\n"
        "1\t3\t4\tWhere is Paris?\tWho is Bob?\t0\n");
    Dataset ds = load_dataset(p, false);

    ASSERT_EQ(ds.count(), 2u);
    EXPECT_EQ(ds.provenance(), Provenance::Real);
    EXPECT_TRUE(ds.labels_authoritative());
    EXPECT_EQ(ds.records()[0].text, "How old are you? [SEP] What is your age?");
    EXPECT_FLOAT_EQ(ds.records()[0].label, 1.f);
    EXPECT_EQ(ds.records()[1].text, "Where is Paris? [SEP] Who is Bob?");
    EXPECT_FLOAT_EQ(ds.records()[1].label, 0.f);
}

TEST(DatasetLoaderTest, DropsUnparseableAndOutOfRangeLabels)
{
    const std::string p = write_tmp("qqp_mixed.tsv",
        "question1\tquestion2\tis_duplicate\n"
        "a\tb\t1\n"
        "c\td\tmaybe\n"
        "e\tf\t\n"
        "g\th\t2\n"
        "i\tj\t0.0\n"
        "k\tl\t0.9999999\n");
    Dataset ds = load_dataset(p, false);

    ASSERT_EQ(ds.count(), 2u);
    EXPECT_EQ(ds.records()[0].text, "a [SEP] b");
    EXPECT_FLOAT_EQ(ds.records()[0].label, 1.f);
    EXPECT_EQ(ds.records()[1].text, "i [SEP] j");
    EXPECT_FLOAT_EQ(ds.records()[1].label, 0.f);
}

TEST(DatasetLoaderTest, NullQuestionIsSkippedInText)
{
    const std::string p = write_tmp("qqp_nullq.tsv",
        "question1\tquestion2\tis_duplicate\n"
        "\tonly second\t0\n"
        "\t\t1\n"
        "x\ty\t1\n");
    Dataset ds = load_dataset(p, false);

    ASSERT_EQ(ds.count(), 2u);
    EXPECT_EQ(ds.records()[0].text, "only second");
    EXPECT_EQ(ds.records()[1].text, "x [SEP] y");
}

TEST(DatasetLoaderTest, EvaluationSetGetsPlaceholderLabels)
{
    const std::string p = write_tmp("qqp_test.tsv",
        "id\tquestion1\tquestion2\n"
        "0\tq one\tq two\n"
        "1\tq three\tq four\n");
    Dataset ds = load_dataset(p, true);

    ASSERT_EQ(ds.count(), 2u);
    EXPECT_FALSE(ds.labels_authoritative());
    EXPECT_EQ(ds.provenance(), Provenance::Real);
    for (const auto& r : ds.records()) EXPECT_FLOAT_EQ(r.label, 0.f);
}

TEST(DatasetLoaderTest, MissingFileFallsBackToSample)
{
    Dataset ds = load_dataset(::testing::TempDir() + "missing_qqp.tsv", false);

    ASSERT_EQ(ds.count(), 3u);
    EXPECT_TRUE(ds.is_fallback());
    EXPECT_EQ(ds.labels(), (std::vector<float>{1.f, 0.f, 1.f}));
    EXPECT_EQ(ds.records()[1].text,
              "What is the capital of France? [SEP] What is the population of Germany?");
}

TEST(DatasetLoaderTest, HeaderOnlyFallsBack)
{
    const std::string p = write_tmp("qqp_header_only.tsv",
        "question1\tquestion2\tis_duplicate\n");
    EXPECT_TRUE(load_dataset(p, false).is_fallback());
}

TEST(DatasetLoaderTest, MissingColumnsFallBack)
{
    const std::string no_q = write_tmp("qqp_no_q.tsv", "a\tb\n1\t2\n");
    EXPECT_TRUE(load_dataset(no_q, false).is_fallback());

    const std::string no_label = write_tmp("qqp_no_label.tsv",
        "question1\tquestion2\nx\ty\n");
    EXPECT_TRUE(load_dataset(no_label, false).is_fallback());
}

TEST(DatasetLoaderTest, AllRowsFilteredThrowsEmptyDataset)
{
    const std::string p = write_tmp("qqp_all_bad.tsv",
        "question1\tquestion2\tis_duplicate\n"
        "a\tb\t7\n"
        "c\td\tyes\n");
    EXPECT_THROW(load_dataset(p, false), EmptyDataset);
}

TEST(DatasetLoaderTest, FilteringNeverGrowsTheSet)
{
    const std::string p = write_tmp("qqp_count.tsv",
        "question1\tquestion2\tis_duplicate\n"
        "a\tb\t1\nc\td\t3\ne\tf\t0\n");
    Dataset ds = load_dataset(p, false);
    EXPECT_LE(ds.count(), 3u);
    EXPECT_EQ(ds.count(), 2u);
}

TEST(DatasetLoaderTest, LabelHistogram)
{
    auto h = label_histogram(fallback_dataset());
    EXPECT_EQ(h[0.f], 1u);
    EXPECT_EQ(h[1.f], 2u);
}

TEST(DatasetLoaderTest, JoinPair)
{
    const std::string a = "a", b = "b";
    EXPECT_EQ(join_pair(&a, &b), "a [SEP] b");
    EXPECT_EQ(join_pair(nullptr, &b), "b");
    EXPECT_EQ(join_pair(&a, nullptr), "a");
    EXPECT_EQ(join_pair(nullptr, nullptr), "");
}
