#include <fstream>
#include <sstream>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "dataset_loader.hpp"
#include "report.hpp"
#include "test_util.hpp"

namespace {

/* one failed + one successful row on the built-in sample */
ComparisonTable sample_table()
{
    EmbedOpt e;
    e.dim    = 8;
    e.epochs = 1;
    e.bucket = 1000;

    VariantConfig broken;
    broken.name         = "broken";
    broken.opt.max_iter = 0;
    VariantConfig ok;

    Dataset ds = fallback_dataset();
    return BenchmarkRunner(e).run(ds, ds, {broken, ok});
}

} // namespace

TEST(ReportTest, TableShowsFailureStageAndMarks)
{
    ComparisonTable t = sample_table();
    std::ostringstream os;
    print_table(t, os);
    const std::string s = os.str();

    EXPECT_NE(s.find("FAILED"), std::string::npos);
    EXPECT_NE(s.find("TRAIN"), std::string::npos);
    EXPECT_NE(s.find("FastText!"), std::string::npos);
    EXPECT_NE(s.find("best by F1: FastText"), std::string::npos);
}

TEST(ReportTest, BestByF1IgnoresFailures)
{
    EXPECT_EQ(best_by_f1(sample_table()), "FastText");
    EXPECT_EQ(best_by_f1(ComparisonTable{}), "");
}

TEST(ReportTest, JsonAndCsvHaveOneEntryPerRow)
{
    ComparisonTable t = sample_table();
    const std::string jp = ::testing::TempDir() + "report.json";
    const std::string cp = ::testing::TempDir() + "report.csv";
    write_json(t, jp);
    write_csv(t, cp);

    std::ifstream jin(jp);
    nlohmann::json j = nlohmann::json::parse(jin);
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["status"], "failed");
    EXPECT_EQ(j[0]["stage"], "TRAIN");
    EXPECT_EQ(j[1]["status"], "ok");
    EXPECT_TRUE(j[1]["fallback_data"].get<bool>());

    std::ifstream cin(cp);
    std::string line;
    size_t lines = 0;
    while (std::getline(cin, line)) ++lines;
    EXPECT_EQ(lines, 3u);
}

TEST(ReportTest, UnwritablePathThrows)
{
    ComparisonTable t;
    EXPECT_THROW(write_json(t, "/nonexistent-dir/x.json"), std::runtime_error);
    EXPECT_THROW(write_csv (t, "/nonexistent-dir/x.csv"),  std::runtime_error);
}
