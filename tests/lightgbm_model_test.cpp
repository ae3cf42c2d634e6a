#include <gtest/gtest.h>

#include "model_iface.hpp"
#include "test_util.hpp"

TEST(LightGBMModelTest, SeparatesBlobs)
{
    FeatMat X; std::vector<float> y;
    make_blobs(200, 4, X, y);

    TrainOpt opt;
    opt.trees            = 20;
    opt.min_data_in_leaf = 5;
    opt.threads          = 1;

    auto m = make_lightgbm();
    m->fit(X, y, opt);
    auto pred = m->predict(X);

    size_t hit = 0;
    for (size_t i = 0; i < y.size(); ++i) hit += float(pred[i]) == y[i];
    EXPECT_GE(double(hit) / y.size(), 0.9);
}

TEST(LightGBMModelTest, RejectsBadInput)
{
    FeatMat X; std::vector<float> y;
    make_blobs(20, 2, X, y);
    auto m = make_lightgbm();

    TrainOpt no_trees;
    no_trees.trees = 0;
    EXPECT_THROW(m->fit(X, y, no_trees), InvalidInput);
    EXPECT_THROW(m->fit(X, std::vector<float>(20, 0.f), TrainOpt{}), InvalidInput);
    EXPECT_THROW(m->predict_proba(X), InvalidInput);
}

TEST(LightGBMModelTest, SavesTextModel)
{
    FeatMat X; std::vector<float> y;
    make_blobs(60, 2, X, y);
    TrainOpt opt;
    opt.trees            = 5;
    opt.min_data_in_leaf = 5;

    auto m = make_lightgbm();
    m->fit(X, y, opt);
    const std::string p = ::testing::TempDir() + "gbdt" + m->file_ext();
    m->save(p);
    EXPECT_TRUE(file_exists(p));
}
