/**********************************************************************
 * benchmark.cpp
 *
 * One run =  build features once  →  for every variant:
 *            TRAIN → EVALUATE → RECORD
 *
 * A variant that throws is recorded as a Failed row with the stage it
 * died in; the loop always moves on to the next variant.
 *********************************************************************/
#include <sstream>

#include "benchmark.hpp"

using namespace std;

/* ───────────── variants ───────────── */
const char* variant_key(ModelVariant v)
{
    switch (v) {
        case ModelVariant::FastTextLinear: return "fasttext_lr";
        case ModelVariant::FastTextGbdt:   return "fasttext_gbdt";
        case ModelVariant::FastTextMlp:    return "fasttext_mlp";
    }
    return "?";
}

const char* variant_display(ModelVariant v)
{
    switch (v) {
        case ModelVariant::FastTextLinear: return "FastText";
        case ModelVariant::FastTextGbdt:   return "FastText+GBDT";
        case ModelVariant::FastTextMlp:    return "FastText+MLP";
    }
    return "?";
}

ModelVariant parse_variant(const string& raw)
{
    const string key = to_lower(trim(raw));
    if (key == "fasttext_lr"   || key == "fasttext") return ModelVariant::FastTextLinear;
    if (key == "fasttext_gbdt" || key == "lightgbm") return ModelVariant::FastTextGbdt;
    if (key == "fasttext_mlp"  || key == "fannmlp")  return ModelVariant::FastTextMlp;
    throw InvalidInput("unknown model variant '" + raw + "'");
}

unique_ptr<IModel> make_model(ModelVariant v)
{
    switch (v) {
        case ModelVariant::FastTextLinear: return make_logreg();
        case ModelVariant::FastTextGbdt:   return make_lightgbm();
        case ModelVariant::FastTextMlp:    return make_fann();
    }
    throw InvalidInput("unhandled model variant");
}

const char* stage_name(VariantStage s)
{
    switch (s) {
        case VariantStage::LoadFeatures: return "LOAD_FEATURES";
        case VariantStage::Train:        return "TRAIN";
        case VariantStage::Evaluate:     return "EVALUATE";
        case VariantStage::Record:       return "RECORD";
    }
    return "?";
}


/* ───────────── features ───────────── */
FeatureSet build_features(const Dataset& train, const Dataset& eval,
                          const EmbedOpt& opt, const string& save_vectors)
{
    const double t0 = now_sec();

    /* embedding sees training text only */
    EmbeddingModel emb = train_embedding(train.texts(), opt);
    if (!save_vectors.empty()) {
        try {
            emb.save_vec(save_vectors);
        } catch (const std::runtime_error& e) {
            logW(string("vector dump skipped: ") + e.what());
        }
    }

    FeatureSet fs;
    fs.X_train    = vectorize_all(train.texts(), emb);
    fs.y_train    = train.labels();
    fs.X_eval     = vectorize_all(eval.texts(), emb);
    fs.y_eval     = eval.labels();
    fs.vocab_size = emb.vocab_size();
    fs.eval_labels_authoritative = eval.labels_authoritative();
    fs.build_seconds = now_sec() - t0;

    ostringstream os;
    os << "features: train=" << fs.X_train.rows() << 'x' << fs.X_train.cols()
       << " eval=" << fs.X_eval.rows() << " vocab=" << fs.vocab_size
       << " (" << fs.build_seconds << " s)";
    logI(os.str());
    return fs;
}


/* ───────────── one variant ───────────── */
Metrics run_variant(const VariantConfig& cfg, const FeatureSet& feats,
                    VariantStage& stage, const string& checkpoint)
{
    stage = VariantStage::Train;
    unique_ptr<IModel> model = make_model(cfg.kind);
    const double t0 = now_sec();
    model->fit(feats.X_train, feats.y_train, cfg.opt);
    const double fit_s = now_sec() - t0;
    if (!checkpoint.empty()) model->save(checkpoint);

    stage = VariantStage::Evaluate;
    Metrics m = evaluate(*model, feats.X_eval, feats.y_eval);
    m.model                 = cfg.label();
    m.feature_seconds       = feats.build_seconds;
    m.fit_seconds           = fit_s;
    m.training_time_seconds = feats.build_seconds + fit_s;
    m.labels_authoritative  = feats.eval_labels_authoritative;
    return m;
}


/* ───────────── table / runner ───────────── */
size_t ComparisonTable::successful() const
{
    size_t n = 0;
    for (const auto& e : rows_) n += e.ok();
    return n;
}

BenchmarkRunner::BenchmarkRunner(EmbedOpt embed, string checkpoint_dir,
                                 string save_vectors)
    : embed_(embed),
      ckpt_dir_(std::move(checkpoint_dir)),
      save_vectors_(std::move(save_vectors))
{}

ComparisonTable BenchmarkRunner::run(const Dataset& train, const Dataset& eval,
                                     const vector<VariantConfig>& variants) const
{
    ComparisonTable table;
    const bool fallback = train.is_fallback() || eval.is_fallback();
    if (fallback)
        logW("benchmark runs on the built-in sample data – scores are not meaningful");
    if (!eval.labels_authoritative())
        logW("evaluation labels are placeholders – metrics are marked with '*'");

    if (!ckpt_dir_.empty() && !ensure_dir(ckpt_dir_))
        logW("cannot create checkpoint dir " + ckpt_dir_ + ", checkpoints disabled");
    const bool ckpt = !ckpt_dir_.empty() && is_directory(ckpt_dir_);

    FeatureSet feats;
    bool       have_feats = false;
    string     feat_error;                  // sticky LOAD_FEATURES failure

    for (size_t k = 0; k < variants.size(); ++k) {
        const VariantConfig& cfg = variants[k];
        logI("[" + to_string(k + 1) + "/" + to_string(variants.size()) + "] " +
             cfg.label());

        TableEntry entry;
        entry.variant       = cfg.label();
        entry.fallback_data = fallback;
        VariantStage stage  = VariantStage::LoadFeatures;

        try {
            if (!have_feats) {
                if (!feat_error.empty()) throw InvalidInput(feat_error);
                try {
                    feats      = build_features(train, eval, embed_, save_vectors_);
                    have_feats = true;
                } catch (const std::exception& e) {
                    feat_error = e.what();
                    throw;
                }
            }

            string path;
            if (ckpt)
                path = ckpt_dir_ + "/" + variant_key(cfg.kind) + "_" +
                       to_string(k) + make_model(cfg.kind)->file_ext();

            Metrics m = run_variant(cfg, feats, stage, path);

            stage          = VariantStage::Record;
            entry.status   = EntryStatus::Ok;
            entry.metrics  = std::move(m);
            entry.stage    = stage;

            ostringstream os;
            os << cfg.label() << ": acc=" << entry.metrics.accuracy
               << " f1=" << entry.metrics.f1
               << " auc=" << entry.metrics.auc
               << " train_s=" << entry.metrics.training_time_seconds;
            logI(os.str());
        } catch (const std::exception& e) {
            entry.status = EntryStatus::Failed;
            entry.stage  = stage;
            entry.error  = e.what();
            entry.metrics.model = cfg.label();
            logE(cfg.label() + " failed at " + stage_name(stage) + ": " + e.what());
        }
        table.append(std::move(entry));
    }

    logI("benchmark done: " + to_string(table.successful()) + "/" +
         to_string(table.size()) + " variants succeeded");
    return table;
}
