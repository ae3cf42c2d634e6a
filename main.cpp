/* -----------------------------------------------------------
 *  main.cpp – driver for the duplicate-question benchmark
 * ----------------------------------------------------------- */
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <omp.h>

#include "benchmark.hpp"
#include "config.hpp"
#include "dataset_loader.hpp"
#include "report.hpp"

static std::string join(const std::vector<std::string>& v,
                        const std::string& sep = ", ")
{
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        out += v[i];
        if (i + 1 < v.size()) out += sep;
    }
    return out;
}

/* size, label histogram and the first few records */
static void describe(const std::string& tag, const Dataset& ds, size_t head = 5)
{
    std::cout << tag << ": " << ds.count() << " records ("
              << provenance_name(ds.provenance())
              << (ds.labels_authoritative() ? "" : ", placeholder labels")
              << ")  source=" << ds.source() << '\n';
    for (const auto& kv : label_histogram(ds))
        std::cout << "  label " << kv.first << " : " << kv.second << '\n';
    for (size_t i = 0; i < std::min(head, ds.count()); ++i) {
        const Record& r = ds.records()[i];
        std::cout << "  [" << r.label << "] " << r.text << '\n';
    }
}


int main(int argc, char* argv[])
{
    /* ========== 1. CLI / config ============================= */
    BenchConfig cfg;
    try {
        cfg = parse_cli(argc, argv);
    } catch (const BenchError& e) {
        logE(e.what());
        return 1;
    }

    if (cfg.threads > 0) omp_set_num_threads(cfg.threads);

    std::vector<std::string> names;
    for (const auto& v : cfg.variants) names.push_back(v.label());
    logI("variants : " + join(names));
    logI("threads  : " + std::to_string(omp_get_max_threads()));

    /* ========== 2. Load datasets ============================ */
    Dataset train, eval;
    try {
        train = load_dataset(cfg.data_file, /*is_evaluation_set=*/false);
        eval  = load_dataset(cfg.test_file, /*is_evaluation_set=*/cfg.eval_unlabeled);
    } catch (const EmptyDataset& e) {
        logE(e.what());
        return 1;
    }

    std::cout << std::fixed << std::setprecision(1);
    describe("TRAIN", train);
    describe("TEST ", eval);
    std::cout.unsetf(std::ios::floatfield);
    std::cout << '\n';

    /* ========== 3. Benchmark ================================ */
    BenchmarkRunner runner(cfg.embed, cfg.checkpoint_dir, cfg.save_vectors);
    ComparisonTable table = runner.run(train, eval, cfg.variants);

    /* ========== 4. Report =================================== */
    std::cout << "\n========== Results ==========\n";
    print_table(table, std::cout);

    try {
        if (!cfg.output_json.empty()) write_json(table, cfg.output_json);
        if (!cfg.output_csv.empty())  write_csv (table, cfg.output_csv);
    } catch (const std::runtime_error& e) {
        logE(e.what());
    }

    if (table.successful() == 0) {
        logE("every variant failed");
        return 2;
    }
    return 0;
}
