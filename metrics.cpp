#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>

#include "metrics.hpp"

using namespace std;

const char* metric_name(MetricKind k)
{
    switch (k) {
        case MetricKind::Accuracy:          return "accuracy";
        case MetricKind::WeightedPrecision: return "weightedPrecision";
        case MetricKind::WeightedRecall:    return "weightedRecall";
        case MetricKind::WeightedF1:        return "f1";
    }
    return "?";
}

namespace {

struct ClassCount { size_t tp = 0, pred = 0, support = 0; };

inline double ratio(double a, double b) { return b > 0 ? a / b : 0.0; }

} // namespace

double classification_metric(MetricKind kind,
                             const vector<float>& y_true,
                             const vector<int>&   y_pred)
{
    if (y_true.size() != y_pred.size())
        throw InvalidInput("y_true / y_pred length mismatch");
    if (y_true.empty())
        throw InvalidInput("no labels to score");

    const size_t N = y_true.size();
    if (kind == MetricKind::Accuracy) {
        size_t hit = 0;
        for (size_t i = 0; i < N; ++i)
            hit += float(y_pred[i]) == y_true[i];
        return double(hit) / N;
    }

    /* ---- per-class confusion counts over true ∪ predicted ---- */
    map<int, ClassCount> cls;
    for (size_t i = 0; i < N; ++i) {
        const int t = int(y_true[i]);
        const int p = y_pred[i];
        ++cls[t].support;
        ++cls[p].pred;
        if (t == p) ++cls[t].tp;
    }

    double acc = 0.0;
    for (const auto& kv : cls) {
        const ClassCount& c = kv.second;
        const double prec = ratio(c.tp, c.pred);
        const double rec  = ratio(c.tp, c.support);
        double v = 0.0;
        switch (kind) {
            case MetricKind::WeightedPrecision: v = prec; break;
            case MetricKind::WeightedRecall:    v = rec;  break;
            default:                            v = ratio(2 * prec * rec, prec + rec);
        }
        acc += v * c.support;
    }
    return acc / N;
}

double roc_auc(const vector<float>& y_true, const vector<double>& scores)
{
    if (y_true.size() != scores.size())
        throw InvalidInput("y_true / scores length mismatch");

    const size_t N = y_true.size();
    size_t P = 0;
    for (float v : y_true) P += v == 1.f;
    const size_t Q = N - P;
    if (P == 0 || Q == 0) return numeric_limits<double>::quiet_NaN();

    /* Mann-Whitney U with average ranks for ties */
    vector<size_t> idx(N);
    iota(idx.begin(), idx.end(), size_t(0));
    sort(idx.begin(), idx.end(),
         [&](size_t a, size_t b){ return scores[a] < scores[b]; });

    double rank_sum = 0.0;
    for (size_t i = 0; i < N; ) {
        size_t j = i;
        while (j + 1 < N && scores[idx[j + 1]] == scores[idx[i]]) ++j;
        const double r = 0.5 * double(i + j) + 1.0;      // 1-based mean rank
        for (size_t k = i; k <= j; ++k)
            if (y_true[idx[k]] == 1.f) rank_sum += r;
        i = j + 1;
    }
    return (rank_sum - double(P) * (P + 1) / 2.0) / (double(P) * Q);
}

Metrics evaluate(const IModel& model, const FeatMat& X, const vector<float>& y)
{
    if (X.rows() == 0 || y.empty())
        throw InvalidInput("empty evaluation set");
    if (size_t(X.rows()) != y.size())
        throw InvalidInput("feature rows (" + to_string(X.rows()) +
                           ") != labels (" + to_string(y.size()) + ")");

    const vector<double> prob = model.predict_proba(X);
    vector<int> pred(prob.size());
    for (size_t i = 0; i < prob.size(); ++i) pred[i] = prob[i] > 0.5;

    Metrics m;
    m.model     = model.name();
    m.accuracy  = classification_metric(MetricKind::Accuracy,          y, pred);
    m.precision = classification_metric(MetricKind::WeightedPrecision, y, pred);
    m.recall    = classification_metric(MetricKind::WeightedRecall,    y, pred);
    m.f1        = classification_metric(MetricKind::WeightedF1,        y, pred);
    m.auc       = roc_auc(y, prob);
    return m;
}
