/*  lightgbm_model.cpp  --------------------------------------- */
#include <LightGBM/c_api.h>
#include <algorithm>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

#include "model_iface.hpp"

/* ★ util – turn a LightGBM error code into an exception */
inline void chk(int rc, const char* what){
    if (rc != 0)
        throw std::runtime_error(std::string(what) + ": " + LGBM_GetLastError());
}

struct BoosterFree { void operator()(void* b) const { if (b) LGBM_BoosterFree(b); } };
struct DatasetFree { void operator()(void* d) const { if (d) LGBM_DatasetFree(d); } };
using booster_ptr = std::unique_ptr<void, BoosterFree>;
using dataset_ptr = std::unique_ptr<void, DatasetFree>;

class LGBModel : public IModel {
public:
    std::string name()     const override { return "lightgbm"; }
    std::string file_ext() const override { return ".txt"; }

    /*  ------------------------------------------------------------
        LGBModel::fit  –  plain binary objective, fixed #trees
        ------------------------------------------------------------ */
    void fit(const FeatMat&            X,
             const std::vector<float>& y,
             const TrainOpt&           opt) override
    {
        check_training_input(X, y);
        if (opt.trees <= 0)      throw InvalidInput("trees must be > 0");
        if (opt.num_leaves < 2)  throw InvalidInput("num_leaves must be >= 2");

        const int N = static_cast<int>(X.rows());
        const int D = static_cast<int>(X.cols());
        const double lr = opt.lr > 0 ? opt.lr : 0.1;

        /* same string for dataset + booster, so pre-filtering agrees */
        std::string param = "objective=binary metric=binary_logloss"
              " learning_rate="    + std::to_string(lr)
            + " num_leaves="       + std::to_string(opt.num_leaves)
            + " min_data_in_leaf=" + std::to_string(std::max(1, opt.min_data_in_leaf))
            + " min_data_in_bin=1"
            + " seed="             + std::to_string(opt.seed)
            + " deterministic=true"
            + " verbosity=-1";
        if (opt.threads > 0) param += " num_threads=" + std::to_string(opt.threads);

        /* ---------- 1. dataset ---------- */
        DatasetHandle dh = nullptr;
        chk(LGBM_DatasetCreateFromMat(X.data(), C_API_DTYPE_FLOAT32,
                                      N, D, /*row-major*/1, param.c_str(),
                                      nullptr, &dh),
            "DatasetCreate failed");
        dataset_ptr dtrain(dh);
        chk(LGBM_DatasetSetField(dtrain.get(), "label", y.data(), N,
                                 C_API_DTYPE_FLOAT32),
            "DatasetSetField(label) failed");

        /* ---------- 2. booster + boosting loop ---------- */
        BoosterHandle bh = nullptr;
        chk(LGBM_BoosterCreate(dtrain.get(), param.c_str(), &bh),
            "BoosterCreate failed");
        booster_ptr booster(bh);

        int done = 0;
        for (int it = 0; it < opt.trees; ++it) {
            int fin = 0;
            chk(LGBM_BoosterUpdateOneIter(booster.get(), &fin),
                "BoosterUpdateOneIter failed");
            ++done;
            progress("lgbm", size_t(it + 1), size_t(opt.trees));
            if (fin) { std::fputc('\n', stderr); break; }   // nothing left to split
        }

        booster_   = std::move(booster);
        dim_       = D;
        logI("lightgbm fitted: N=" + std::to_string(N) + " trees=" + std::to_string(done));
    }

    std::vector<double> predict_proba(const FeatMat& X) const override
    {
        check_predict_input(X, dim_, booster_ != nullptr);
        const int N = static_cast<int>(X.rows());
        std::vector<double> out(size_t(N), 0.0);
        if (N == 0) return out;

        int64_t out_len = 0;
        chk(LGBM_BoosterPredictForMat(
                booster_.get(), X.data(), C_API_DTYPE_FLOAT32,
                N, dim_, /*row-major*/1, C_API_PREDICT_NORMAL,
                0, -1, "", &out_len, out.data()),
            "PredictForMat failed");
        return out;
    }

    void save(const std::string& path) const override
    {
        if (!booster_) throw InvalidInput("model is not fitted");
        chk(LGBM_BoosterSaveModel(booster_.get(), 0, -1, 0, path.c_str()),
            "BoosterSaveModel failed");
        logI("LightGBM model saved → " + path);
    }

private:
    booster_ptr booster_;
    int         dim_ = 0;
};

/* factory – so the runner can remain agnostic */
std::unique_ptr<IModel> make_lightgbm() {
    return std::make_unique<LGBModel>();
}
