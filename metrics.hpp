/* ──────────────────────────────────────────────────────────────
   metrics.hpp  –  classification scores + evaluation record
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

#include "model_iface.hpp"

enum class MetricKind { Accuracy, WeightedPrecision, WeightedRecall, WeightedF1 };
const char* metric_name(MetricKind k);

/*  Pure scoring of hard labels.
    Weighted kinds average the per-class score over the union of
    true and predicted classes, weighted by true-class support;
    0/0 counts as 0.                                            */
double classification_metric(MetricKind               kind,
                             const std::vector<float>& y_true,
                             const std::vector<int>&   y_pred);

/* ROC AUC, tied scores share their average rank; NaN for one class */
double roc_auc(const std::vector<float>&  y_true,
               const std::vector<double>& scores);

struct Metrics {
    std::string model;
    double accuracy  = 0;
    double precision = 0;
    double recall    = 0;
    double f1        = 0;
    double auc       = 0;
    double training_time_seconds = 0;   // feature_seconds + fit_seconds
    double feature_seconds       = 0;
    double fit_seconds           = 0;
    bool   labels_authoritative  = true;
};

/*  Scores a fitted model on (X, y); model and inputs untouched.
    throws InvalidInput when rows(X) != |y| or the set is empty  */
Metrics evaluate(const IModel& model, const FeatMat& X,
                 const std::vector<float>& y);
