/*  fannmlp_model.cpp  ---------------------------------------- */
#include <fann.h>

#include <algorithm>
#include <memory>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

#include "model_iface.hpp"

using fann_ptr = std::unique_ptr<struct fann, void(*)(struct fann*)>;
inline fann_ptr wrap_fann(struct fann *p) { return fann_ptr(p, fann_destroy); }

/* single-row inference */
inline float fann_predict(const struct fann *net, const float *feat)
{
    // fann_run wants a writable pointer
    return fann_run(const_cast<fann*>(net),
                    const_cast<float*>(feat))[0];
}

class FANNModel : public IModel {
public:
    std::string name()     const override { return "fann_mlp"; }
    std::string file_ext() const override { return ".net"; }

    /* ---------------------------------------------------------------
     *  FANNModel::fit – INPUT → h1 → 1, one weight update per batch
     * --------------------------------------------------------------- */
    void fit(const FeatMat&            X,
             const std::vector<float>& y,
             const TrainOpt&           opt) override
    {
        check_training_input(X, y);
        if (opt.epochs     <= 0) throw InvalidInput("epochs must be > 0");
        if (opt.batch_size <= 0) throw InvalidInput("batch_size must be > 0");
        if (opt.hidden1    <= 0) throw InvalidInput("hidden must be > 0");

        const unsigned N  = static_cast<unsigned>(X.rows());
        const unsigned D  = static_cast<unsigned>(X.cols());
        const unsigned B  = static_cast<unsigned>(opt.batch_size);
        const float    lr = float(opt.lr > 0 ? opt.lr : 0.7);

        /* ---------- 1. network ---------------------------------- */
        fann_ptr net = wrap_fann(fann_create_standard(
                3, D, static_cast<unsigned>(opt.hidden1), 1u));
        if (!net) throw std::runtime_error("FANN create failed");

        fann_set_training_algorithm(net.get(), FANN_TRAIN_BATCH);
        fann_set_learning_rate      (net.get(), lr);
        fann_set_train_error_function(net.get(), FANN_ERRORFUNC_LINEAR);
        fann_set_activation_function_hidden(net.get(), FANN_SIGMOID_SYMMETRIC);
        fann_set_activation_function_output(net.get(), FANN_SIGMOID);

        std::mt19937 rng(opt.seed);

        /* FANN seeds its own rand() from the clock, overwrite */
        {
            const unsigned C = fann_get_total_connections(net.get());
            std::vector<struct fann_connection> conn(C);
            fann_get_connection_array(net.get(), conn.data());
            std::uniform_real_distribution<float> U(-0.1f, 0.1f);
            for (auto& c : conn) c.weight = U(rng);
            fann_set_weight_array(net.get(), conn.data(), C);
        }

        /* ---------- 2. row pointers, shuffled once -------------- */
        std::vector<unsigned> order(N);
        std::iota(order.begin(), order.end(), 0u);
        std::shuffle(order.begin(), order.end(), rng);

        std::vector<fann_type>  Y(y.begin(), y.end());
        std::vector<fann_type*> rows_in(N), rows_out(N);
        for (unsigned i = 0; i < N; ++i) {
            rows_in [i] = const_cast<fann_type*>(X.data() + size_t(order[i]) * D);
            rows_out[i] = &Y[order[i]];
        }

        /* consecutive slices of rows_in / rows_out */
        std::vector<struct fann_train_data> batches;
        for (unsigned b = 0; b < N; b += B) {
            struct fann_train_data td = {};
            td.num_data   = std::min(B, N - b);
            td.num_input  = D;
            td.num_output = 1;
            td.input      = rows_in .data() + b;
            td.output     = rows_out.data() + b;
            batches.push_back(td);
        }

        /* ---------- 3. epochs ----------------------------------- */
        std::vector<size_t> visit(batches.size());
        std::iota(visit.begin(), visit.end(), size_t(0));
        float mse = 0.f;
        for (int ep = 0; ep < opt.epochs; ++ep) {
            std::shuffle(visit.begin(), visit.end(), rng);
            double sse = 0.0;
            for (size_t k : visit)
                sse += double(fann_train_epoch(net.get(), &batches[k])) *
                       batches[k].num_data;
            mse = float(sse / N);
            progress("mlp epoch", size_t(ep + 1), size_t(opt.epochs));
        }

        net_ = std::move(net);
        dim_ = D;
        logI("fann mlp fitted: N=" + std::to_string(N) + " batches=" +
             std::to_string(batches.size()) + " mse=" + std::to_string(mse));
    }

    std::vector<double> predict_proba(const FeatMat& X) const override
    {
        check_predict_input(X, long(dim_), net_ != nullptr);
        std::vector<double> out(size_t(X.rows()));
        /* fann_run writes neuron state, rows stay sequential */
        for (long i = 0; i < X.rows(); ++i)
            out[size_t(i)] = fann_predict(net_.get(), X.data() + size_t(i) * dim_);
        return out;
    }

    void save(const std::string& path) const override
    {
        if (!net_) throw InvalidInput("model is not fitted");
        if (fann_save(net_.get(), path.c_str()) != 0)
            throw std::runtime_error("fann_save failed: " + path);
        logI("FANN model saved → " + path);
    }

private:
    fann_ptr net_{nullptr, fann_destroy};
    unsigned dim_ = 0;
};

std::unique_ptr<IModel> make_fann() { return std::make_unique<FANNModel>(); }
