#include <gtest/gtest.h>

#include "benchmark.hpp"
#include "dataset_loader.hpp"
#include "test_util.hpp"

namespace {

EmbedOpt tiny_embed()
{
    EmbedOpt o;
    o.dim    = 8;
    o.epochs = 1;
    o.bucket = 1000;
    return o;
}

VariantConfig linear(int max_iter = 100)
{
    VariantConfig v;
    v.kind         = ModelVariant::FastTextLinear;
    v.opt.max_iter = max_iter;
    return v;
}

} // namespace

TEST(BenchmarkTest, VariantKeysRoundTrip)
{
    for (auto v : {ModelVariant::FastTextLinear, ModelVariant::FastTextGbdt,
                   ModelVariant::FastTextMlp})
        EXPECT_EQ(parse_variant(variant_key(v)), v);
    EXPECT_EQ(parse_variant(" FastText_GBDT "), ModelVariant::FastTextGbdt);
    EXPECT_THROW(parse_variant("bert"), InvalidInput);
    EXPECT_STREQ(variant_display(ModelVariant::FastTextLinear), "FastText");
}

TEST(BenchmarkTest, FeaturesUseTrainingTextOnly)
{
    Dataset train = fallback_dataset();
    Dataset eval(std::vector<Record>{{"zebra giraffe", 0.f}, {"how do", 1.f}},
                 Provenance::Real, true, "mem");

    FeatureSet fs = build_features(train, eval, tiny_embed());
    EXPECT_EQ(fs.X_train.rows(), 3);
    EXPECT_EQ(fs.X_train.cols(), 8);
    EXPECT_EQ(fs.X_eval.rows(), 2);
    EXPECT_TRUE(fs.X_eval.row(0).isZero());       // no eval token was learned
    EXPECT_FALSE(fs.X_eval.row(1).isZero());
    EXPECT_EQ(fs.y_eval, (std::vector<float>{0.f, 1.f}));
    EXPECT_GE(fs.build_seconds, 0.0);
}

TEST(BenchmarkTest, FailedVariantDoesNotStopTheRun)
{
    Dataset ds = fallback_dataset();
    BenchmarkRunner runner(tiny_embed());

    ComparisonTable t = runner.run(ds, ds, {linear(0), linear()});

    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t.successful(), 1u);

    const TableEntry& bad = t.rows()[0];
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.stage, VariantStage::Train);
    EXPECT_NE(bad.error.find("max_iter"), std::string::npos);

    const TableEntry& good = t.rows()[1];
    EXPECT_TRUE(good.ok());
    EXPECT_EQ(good.variant, "FastText");
    EXPECT_TRUE(good.fallback_data);
    EXPECT_GE(good.metrics.accuracy, 0.0);
    EXPECT_LE(good.metrics.accuracy, 1.0);
    EXPECT_NEAR(good.metrics.training_time_seconds,
                good.metrics.feature_seconds + good.metrics.fit_seconds, 1e-9);
}

TEST(BenchmarkTest, FeatureFailureMarksEveryVariant)
{
    EmbedOpt bad = tiny_embed();
    bad.dim = 0;
    Dataset ds = fallback_dataset();

    ComparisonTable t = BenchmarkRunner(bad).run(ds, ds, {linear(), linear()});
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t.successful(), 0u);
    for (const auto& e : t.rows()) {
        EXPECT_EQ(e.stage, VariantStage::LoadFeatures);
        EXPECT_FALSE(e.error.empty());
    }
}

TEST(BenchmarkTest, PlaceholderLabelsAreFlagged)
{
    Dataset train = fallback_dataset();
    std::vector<Record> recs = train.records();
    Dataset eval(recs, Provenance::Real, /*labels_authoritative=*/false, "mem");

    ComparisonTable t = BenchmarkRunner(tiny_embed()).run(train, eval, {linear()});
    ASSERT_EQ(t.successful(), 1u);
    EXPECT_FALSE(t.rows()[0].metrics.labels_authoritative);
}

TEST(BenchmarkTest, CheckpointsAreWritten)
{
    const std::string dir = ::testing::TempDir() + "qqp_ckpt";
    Dataset ds = fallback_dataset();

    ComparisonTable t = BenchmarkRunner(tiny_embed(), dir).run(ds, ds, {linear()});
    ASSERT_EQ(t.successful(), 1u);
    EXPECT_TRUE(file_exists(dir + "/fasttext_lr_0.json"));
}
