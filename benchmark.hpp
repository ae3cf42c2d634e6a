/* ──────────────────────────────────────────────────────────────
   benchmark.hpp  –  variants, feature build, comparison table
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "embedding.hpp"
#include "metrics.hpp"
#include "model_iface.hpp"

/* ---------- variants ---------- */
enum class ModelVariant { FastTextLinear, FastTextGbdt, FastTextMlp };

const char*  variant_key    (ModelVariant v);   // "fasttext_lr" ...
const char*  variant_display(ModelVariant v);   // "FastText" ...
ModelVariant parse_variant  (const std::string& key);   // InvalidInput if unknown

std::unique_ptr<IModel> make_model(ModelVariant v);

struct VariantConfig {
    ModelVariant kind = ModelVariant::FastTextLinear;
    std::string  name;            // row label, display name when empty
    TrainOpt     opt;

    std::string label() const { return name.empty() ? variant_display(kind) : name; }
};

/* ---------- shared features ---------- */
struct FeatureSet {
    FeatMat            X_train;
    std::vector<float> y_train;
    FeatMat            X_eval;
    std::vector<float> y_eval;
    double             build_seconds = 0;
    bool               eval_labels_authoritative = true;
    std::size_t        vocab_size = 0;
};

/*  Trains the embedding on train.texts() only, then vectorizes both
    sets.  `save_vectors` (optional) receives the .vec dump.        */
FeatureSet build_features(const Dataset& train, const Dataset& eval,
                          const EmbedOpt& opt,
                          const std::string& save_vectors = "");

/* ---------- per-variant pipeline ---------- */
enum class VariantStage { LoadFeatures, Train, Evaluate, Record };
const char* stage_name(VariantStage s);

/*  TRAIN → EVALUATE for one variant on prebuilt features.
    `stage` tracks the step in progress so a caller can attribute a
    failure; the fitted model goes to `checkpoint` when non-empty.  */
Metrics run_variant(const VariantConfig& cfg, const FeatureSet& feats,
                    VariantStage& stage,
                    const std::string& checkpoint = "");

/* ---------- results ---------- */
enum class EntryStatus { Ok, Failed };

struct TableEntry {
    std::string  variant;
    EntryStatus  status = EntryStatus::Ok;
    Metrics      metrics;                       // valid when Ok
    VariantStage stage  = VariantStage::Record; // failing stage
    std::string  error;
    bool         fallback_data = false;         // trained/scored on the sample

    bool ok() const { return status == EntryStatus::Ok; }
};

/*  Insertion-ordered; only BenchmarkRunner appends.  */
class ComparisonTable {
public:
    const std::vector<TableEntry>& rows() const { return rows_; }
    std::size_t size()       const { return rows_.size(); }
    std::size_t successful() const;

private:
    friend class BenchmarkRunner;
    void append(TableEntry e) { rows_.push_back(std::move(e)); }

    std::vector<TableEntry> rows_;
};

class BenchmarkRunner {
public:
    explicit BenchmarkRunner(EmbedOpt    embed,
                             std::string checkpoint_dir = "",
                             std::string save_vectors   = "");

    /*  Runs every variant in order; a failing variant becomes a
        Failed row and never stops the loop.                       */
    ComparisonTable run(const Dataset& train, const Dataset& eval,
                        const std::vector<VariantConfig>& variants) const;

private:
    EmbedOpt    embed_;
    std::string ckpt_dir_;
    std::string save_vectors_;
};
