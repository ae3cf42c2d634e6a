#include "model_iface.hpp"

void check_training_input(const FeatMat& X, const std::vector<float>& y)
{
    if (X.rows() == 0 || y.empty())
        throw InvalidInput("empty training set");
    if (size_t(X.rows()) != y.size())
        throw InvalidInput("feature rows (" + std::to_string(X.rows()) +
                           ") != labels (" + std::to_string(y.size()) + ")");
    if (X.cols() == 0)
        throw InvalidInput("feature vectors have zero dimension");

    size_t P = 0, N = 0;
    for (float v : y) {
        if      (v == 1.f) ++P;
        else if (v == 0.f) ++N;
        else throw InvalidInput("label " + std::to_string(v) + " is not 0/1");
    }
    if (P == 0 || N == 0)
        throw InvalidInput("training labels hold a single class");
}

void check_predict_input(const FeatMat& X, long fitted_cols, bool fitted)
{
    if (!fitted)
        throw InvalidInput("model is not fitted");
    if (X.rows() > 0 && X.cols() != fitted_cols)
        throw InvalidInput("feature dim " + std::to_string(X.cols()) +
                           " != fitted dim " + std::to_string(fitted_cols));
}
