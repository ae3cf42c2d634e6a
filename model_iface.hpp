/* ──────────────────────────────────────────────────────────────
   model_iface.hpp     –  the classifier abstraction layer
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common.hpp"

struct TrainOpt {
    /* generic hyper-params – each model ignores the ones it
       doesn’t need                                            */
    int      max_iter   = 100;     // logistic regression
    double   C          = 1.0;     //   inverse L2 strength
    double   tol        = 1e-4;
    int      trees      = 100;     // GBDT
    int      num_leaves = 31;
    int      min_data_in_leaf = 20;
    double   lr         = 0;       // GBDT shrinkage / MLP step, 0 = model default
    int      hidden1    = 64;      // MLP
    int      epochs     = 3;
    int      batch_size = 64;
    int      threads    = 0;       // 0 = library default
    uint32_t seed       = 42;
};

struct IModel {
    virtual ~IModel() = default;

    virtual std::string name() const = 0;

    /*  fit on X (one row per record) and 0/1 labels y.
        throws InvalidInput on bad shapes / labels / options   */
    virtual void fit(const FeatMat&            X,
                     const std::vector<float>& y,
                     const TrainOpt&           opt) = 0;

    /*  P(duplicate) per row; requires a fitted model          */
    virtual std::vector<double> predict_proba(const FeatMat& X) const = 0;

    /*  persist the fitted model                               */
    virtual void save(const std::string& path) const = 0;

    /*  file extension used by save()                          */
    virtual std::string file_ext() const = 0;

    /*  hard 0/1 decision: P > tau                              */
    std::vector<int> predict(const FeatMat& X, double tau = 0.5) const {
        std::vector<double> p = predict_proba(X);
        std::vector<int> out(p.size());
        for (size_t i = 0; i < p.size(); ++i) out[i] = p[i] > tau;
        return out;
    }
};

/*  shared fit() precondition:
    rows(X) == |y| > 0, labels ∈ {0,1}, both classes present   */
void check_training_input(const FeatMat& X, const std::vector<float>& y);

/*  shared predict() precondition                              */
void check_predict_input(const FeatMat& X, long fitted_cols, bool fitted);

/* factories – main() / the runner stay model-agnostic */
std::unique_ptr<IModel> make_logreg();
std::unique_ptr<IModel> make_lightgbm();
std::unique_ptr<IModel> make_fann();
