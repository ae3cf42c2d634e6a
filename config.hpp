/* ──────────────────────────────────────────────────────────────
   config.hpp  –  run configuration: JSON file + --key=value flags
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

#include "benchmark.hpp"
#include "embedding.hpp"

struct BenchConfig {
    std::string data_file      = "glue/QQP/dev.tsv";
    std::string test_file      = "glue/QQP/dev.tsv";
    bool        eval_unlabeled = false;
    int         threads        = 0;        // 0 = OpenMP default
    std::string checkpoint_dir;
    std::string save_vectors;
    std::string output_json;
    std::string output_csv;

    EmbedOpt                   embed;
    std::vector<VariantConfig> variants{ VariantConfig{} };
};

/* error in a config file or flag value → exit code 1 */
struct ConfigError : BenchError { using BenchError::BenchError; };

/*  Applies a JSON config on top of `cfg`; every key optional.
    ConfigError on unreadable / malformed files, InvalidInput on an
    unknown model key.                                              */
void load_config_json(const std::string& path, BenchConfig& cfg);

/*  --config is applied first, the remaining flags override it.
    Unknown flags are logged and ignored.                          */
BenchConfig parse_cli(int argc, char* argv[]);
