/**********************************************************************
 * logreg_model.cpp
 *
 * L2-regularised logistic regression exposed through IModel.
 *
 *   min_w  ½‖w‖² + C · Σ logloss(y_i, σ(x_i·w + b))      (b unpenalised)
 *
 * Solved with Newton / IRLS steps + backtracking; stops when the
 * max-abs gradient drops under opt.tol or after opt.max_iter steps.
 *********************************************************************/
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

#include "model_iface.hpp"

using json = nlohmann::json;
using Eigen::MatrixXd;
using Eigen::VectorXd;

namespace {

inline double sigmoid(double z){ return 1.0 / (1.0 + std::exp(-z)); }

/* log(1 + e^z) without overflow */
inline double softplus(double z){
    return z > 0 ? z + std::log1p(std::exp(-z)) : std::log1p(std::exp(z));
}

} // namespace

class LogRegModel : public IModel
{
public:
    std::string name()     const override { return "logreg"; }
    std::string file_ext() const override { return ".json"; }

    /* ------------ fit -------------------------------------------- */
    void fit(const FeatMat&            X,
             const std::vector<float>& y,
             const TrainOpt&           opt) override
    {
        check_training_input(X, y);
        if (opt.max_iter <= 0) throw InvalidInput("max_iter must be > 0");
        if (opt.C <= 0.0)      throw InvalidInput("C must be > 0");

        const long N = X.rows();
        const long D = X.cols();

        /* ---- design matrix with a bias column ---- */
        MatrixXd A(N, D + 1);
        A.leftCols(D) = X.cast<double>();
        A.col(D).setOnes();
        VectorXd t(N);
        for (long i = 0; i < N; ++i) t(i) = y[i];

        VectorXd reg = VectorXd::Ones(D + 1);
        reg(D) = 0.0;                                   // no penalty on b

        auto objective = [&](const VectorXd& w) {
            VectorXd z = A * w;
            double loss = 0;
            for (long i = 0; i < N; ++i)
                loss += softplus(z(i)) - t(i) * z(i);
            return 0.5 * w.cwiseProduct(reg).dot(w) + opt.C * loss;
        };

        VectorXd w = VectorXd::Zero(D + 1);
        double   f = objective(w);
        iters_     = 0;
        converged_ = false;

        for (int it = 0; it < opt.max_iter; ++it) {
            VectorXd z = A * w;
            VectorXd p(N), s(N);
            for (long i = 0; i < N; ++i) {
                p(i) = sigmoid(z(i));
                s(i) = p(i) * (1.0 - p(i));
            }
            VectorXd g = reg.cwiseProduct(w) + opt.C * (A.transpose() * (p - t));
            if (g.cwiseAbs().maxCoeff() <= opt.tol) { converged_ = true; break; }

            MatrixXd H = opt.C * (A.transpose() * s.asDiagonal() * A);
            H.diagonal() += reg;
            H(D, D) += 1e-10;                           // keep bias pivot > 0
            VectorXd step = H.ldlt().solve(g);

            /* ---- backtracking on the objective ---- */
            double   eta   = 1.0;
            VectorXd w_new = w - step;
            double   f_new = objective(w_new);
            while (!(f_new <= f) && eta > 1e-8) {
                eta  *= 0.5;
                w_new = w - eta * step;
                f_new = objective(w_new);
            }
            ++iters_;
            if (!(f_new <= f)) break;                   // no descent possible
            w = w_new;
            f = f_new;
        }
        if (!converged_) {
            VectorXd z = A * w;
            VectorXd p = z.unaryExpr([](double v){ return sigmoid(v); });
            VectorXd g = reg.cwiseProduct(w) + opt.C * (A.transpose() * (p - t));
            converged_ = g.cwiseAbs().maxCoeff() <= opt.tol;
        }
        if (!converged_)
            logW("logreg stopped after " + std::to_string(iters_) +
                 " iterations without reaching tol");

        coef_      = w.head(D);
        intercept_ = w(D);
        fitted_    = true;

        std::ostringstream os;
        os << "logreg fitted: N=" << N << " D=" << D << " iters=" << iters_
           << " loss=" << f;
        logI(os.str());
    }

    /* ------------ predict ---------------------------------------- */
    std::vector<double> predict_proba(const FeatMat& X) const override
    {
        check_predict_input(X, coef_.size(), fitted_);
        VectorXd z = X.cast<double>() * coef_;
        std::vector<double> out(X.rows());
        for (long i = 0; i < X.rows(); ++i)
            out[i] = sigmoid(z(i) + intercept_);
        return out;
    }

    void save(const std::string& path) const override
    {
        if (!fitted_) throw InvalidInput("model is not fitted");
        json j;
        j["model"]     = name();
        j["coef"]      = std::vector<double>(coef_.data(), coef_.data() + coef_.size());
        j["intercept"] = intercept_;
        j["meta"]      = {{"iterations", iters_}, {"converged", converged_},
                          {"features", coef_.size()}};
        std::ofstream out(path);
        if (!out) throw std::runtime_error("cannot write " + path);
        out << j.dump(2);
        logI("logreg model saved → " + path);
    }

private:
    VectorXd coef_;
    double   intercept_ = 0.0;
    int      iters_     = 0;
    bool     converged_ = false;
    bool     fitted_    = false;
};

/* factory – called by the runner for FastTextLinear */
std::unique_ptr<IModel> make_logreg()
{
    return std::make_unique<LogRegModel>();
}
