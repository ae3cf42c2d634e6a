/**********************************************************************
 * embedding.cpp
 *
 * fastText-style skip-gram with negative sampling.  Every vocabulary
 * word is represented by its own row plus the rows of its hashed
 * character n-grams; the input vector of a word is their mean.
 *
 *   tokenize → count → vocab (≥ min_count) → SGD over (center, ctx)
 *   → final vector[w] = mean(word row, n-gram rows)
 *
 * Training is single-threaded and seeded, so it is reproducible.
 *********************************************************************/
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <random>

#include "embedding.hpp"

namespace {

constexpr float MAX_EXP    = 6.f;
constexpr int   TABLE_SIZE = 1000000;       // unigram table for negatives

inline float sigmoid_clip(float x)
{
    if (x >  MAX_EXP) return 1.f;
    if (x < -MAX_EXP) return 0.f;
    return 1.f / (1.f + std::exp(-x));
}

/* fastText's FNV-1a variant: bytes are sign-extended */
uint32_t fnv_hash(const std::string& s)
{
    uint32_t h = 2166136261u;
    for (char c : s) {
        h ^= uint32_t(int8_t(c));
        h *= 16777619u;
    }
    return h;
}

} // namespace


std::vector<std::string> tokenize(const std::string& text)
{
    std::vector<std::string> out;
    std::string cur;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        } else {
            cur.push_back(char(std::tolower(c)));
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::vector<int> subword_ids(const std::string& word, int min_n, int max_n,
                             int bucket)
{
    std::vector<int> ids;
    if (bucket <= 0 || max_n <= 0 || max_n < min_n) return ids;

    const std::string w = "<" + word + ">";
    const size_t L = w.size();
    for (size_t i = 0; i < L; ++i) {
        if ((w[i] & 0xC0) == 0x80) continue;           // UTF-8 continuation
        std::string ng;
        for (size_t j = i, n = 1; j < L && n <= size_t(max_n); ++n) {
            ng.push_back(w[j++]);
            while (j < L && (w[j] & 0xC0) == 0x80) ng.push_back(w[j++]);
            if (int(n) >= min_n && !(n == 1 && (i == 0 || j == L)))
                ids.push_back(int(fnv_hash(ng) % uint32_t(bucket)));
        }
    }
    return ids;
}


int EmbeddingModel::index(const std::string& word) const
{
    auto it = index_.find(word);
    return it == index_.end() ? -1 : it->second;
}

void EmbeddingModel::save_vec(const std::string& path) const
{
    std::ofstream out(path);
    if (!out) throw std::runtime_error("cannot write " + path);
    out << words_.size() << ' ' << dim_ << '\n';
    for (size_t i = 0; i < words_.size(); ++i) {
        out << words_[i];
        for (int d = 0; d < dim_; ++d) out << ' ' << vecs_(i, d);
        out << '\n';
    }
    if (!out) throw std::runtime_error("write failed on " + path);
    logI("embedding vectors saved → " + path);
}


EmbeddingModel train_embedding(const std::vector<std::string>& texts,
                               const EmbedOpt& opt)
{
    if (opt.dim <= 0)      throw InvalidInput("embedding dim must be > 0");
    if (opt.window <= 0)   throw InvalidInput("embedding window must be > 0");
    if (opt.epochs < 0)    throw InvalidInput("embedding epochs must be >= 0");
    if (opt.min_count < 1) throw InvalidInput("min_count must be >= 1");
    if (opt.negative < 0)  throw InvalidInput("negative must be >= 0");
    if (opt.bucket < 0)    throw InvalidInput("bucket must be >= 0");
    if (opt.max_n > 0 && (opt.min_n < 1 || opt.min_n > opt.max_n))
        throw InvalidInput("need 1 <= min_n <= max_n");

    const int D = opt.dim;

    /* ---------- 1. tokenize & count ---------------------------- */
    std::vector<std::vector<std::string>> sents;
    sents.reserve(texts.size());
    std::unordered_map<std::string, long> counts;
    std::vector<std::string> first_seen;
    for (const auto& t : texts) {
        auto toks = tokenize(t);
        for (const auto& w : toks) {
            auto it = counts.find(w);
            if (it == counts.end()) { counts.emplace(w, 1); first_seen.push_back(w); }
            else ++it->second;
        }
        sents.push_back(std::move(toks));
    }

    /* ---------- 2. vocabulary, most frequent first ------------- */
    EmbeddingModel m(D);
    for (const auto& w : first_seen)
        if (counts[w] >= opt.min_count) m.words_.push_back(w);
    std::stable_sort(m.words_.begin(), m.words_.end(),
                     [&](const std::string& a, const std::string& b) {
                         return counts[a] > counts[b];
                     });

    const int V = int(m.words_.size());
    std::vector<long> freq(V);
    long total = 0;
    for (int i = 0; i < V; ++i) {
        m.index_[m.words_[i]] = i;
        freq[i] = counts[m.words_[i]];
        total  += freq[i];
    }
    m.vecs_ = FeatMat::Zero(V, D);
    if (V == 0) {
        logW("embedding vocabulary is empty – every text will vectorize to zero");
        return m;
    }
    logI("embedding vocab=" + std::to_string(V) + " tokens=" +
         std::to_string(total) + " dim=" + std::to_string(D));

    /* ---------- 3. input rows: word row + used n-gram buckets --- */
    std::vector<std::vector<int>> rows_of(V);
    std::unordered_map<int, int> bucket_row;
    int n_rows = V;
    for (int i = 0; i < V; ++i) {
        rows_of[i].push_back(i);
        for (int id : subword_ids(m.words_[i], opt.min_n, opt.max_n, opt.bucket)) {
            auto it = bucket_row.find(id);
            if (it == bucket_row.end()) it = bucket_row.emplace(id, n_rows++).first;
            rows_of[i].push_back(it->second);
        }
    }

    std::mt19937_64 rng(opt.seed);
    std::uniform_real_distribution<float> init(-1.f / D, 1.f / D);
    FeatMat in(n_rows, D);
    for (int r = 0; r < n_rows; ++r)
        for (int d = 0; d < D; ++d) in(r, d) = init(rng);
    FeatMat out = FeatMat::Zero(V, D);

    /* ---------- 4. negative-sampling table  ∝ count^0.75 -------- */
    std::vector<int> table(TABLE_SIZE);
    {
        double norm = 0;
        for (long f : freq) norm += std::pow(double(f), 0.75);
        int    w   = 0;
        double cum = std::pow(double(freq[0]), 0.75) / norm;
        for (int a = 0; a < TABLE_SIZE; ++a) {
            table[a] = w;
            if ((a + 1) / double(TABLE_SIZE) > cum && w < V - 1) {
                ++w;
                cum += std::pow(double(freq[w]), 0.75) / norm;
            }
        }
    }

    /* ---------- 5. down-sampling keep-probability --------------- */
    std::vector<float> keep(V, 1.f);
    if (opt.sample > 0) {
        const double thr = opt.sample * double(total);
        for (int i = 0; i < V; ++i) {
            const double f = double(freq[i]);
            keep[i] = float(std::min(1.0, (std::sqrt(f / thr) + 1.0) * thr / f));
        }
    }

    std::vector<std::vector<int>> ids;
    ids.reserve(sents.size());
    for (const auto& s : sents) {
        std::vector<int> v;
        v.reserve(s.size());
        for (const auto& w : s) {
            int k = m.index(w);
            if (k >= 0) v.push_back(k);
        }
        ids.push_back(std::move(v));
    }
    sents.clear();

    /* ---------- 6. SGD over (center, context) pairs ------------ */
    std::uniform_real_distribution<float> unif(0.f, 1.f);
    const double planned = std::max(1.0, double(total) * opt.epochs);
    double seen = 0;
    Eigen::RowVectorXf h(D), grad(D);
    std::vector<int> s;

    for (int ep = 0; ep < opt.epochs; ++ep) {
        for (const auto& sent : ids) {
            s.clear();
            for (int w : sent)
                if (keep[w] >= 1.f || unif(rng) < keep[w]) s.push_back(w);

            const float alpha = float(std::max(opt.min_alpha,
                    opt.alpha - (opt.alpha - opt.min_alpha) * seen / planned));

            const int len = int(s.size());
            for (int pos = 0; pos < len; ++pos) {
                const auto& rows = rows_of[s[pos]];
                const float  inv = 1.f / float(rows.size());
                h.setZero();
                for (int r : rows) h += in.row(r);
                h *= inv;

                const int b = int(rng() % uint64_t(opt.window));
                const int span = opt.window - b;
                for (int c = pos - span; c <= pos + span; ++c) {
                    if (c == pos || c < 0 || c >= len) continue;
                    grad.setZero();
                    for (int d = 0; d <= opt.negative; ++d) {
                        int   target = s[c];
                        float label  = 1.f;
                        if (d > 0) {
                            target = table[rng() % uint64_t(TABLE_SIZE)];
                            if (target == s[c]) continue;
                            label = 0.f;
                        }
                        const float f = sigmoid_clip(out.row(target).dot(h));
                        const float g = (label - f) * alpha;
                        grad += g * out.row(target);
                        out.row(target) += g * h;
                    }
                    for (int r : rows) in.row(r) += inv * grad;
                }
            }
            seen += double(sent.size());
        }
        progress("fasttext", size_t(ep + 1), size_t(opt.epochs));
    }

    /* ---------- 7. final word vectors --------------------------- */
    for (int i = 0; i < V; ++i) {
        const auto& rows = rows_of[i];
        Eigen::RowVectorXf acc = Eigen::RowVectorXf::Zero(D);
        for (int r : rows) acc += in.row(r);
        m.vecs_.row(i) = acc / float(rows.size());
    }
    return m;
}


FeatVec vectorize(const std::string& text, const EmbeddingModel& model)
{
    FeatVec v = FeatVec::Zero(model.dim());
    int found = 0;
    for (const auto& tok : tokenize(text)) {
        const int i = model.index(tok);
        if (i < 0) continue;                         // OOV: ignored
        v += model.vectors().row(i).transpose();
        ++found;
    }
    if (found) v /= float(found);
    return v;
}

FeatMat vectorize_all(const std::vector<std::string>& texts,
                      const EmbeddingModel& model)
{
    const long N = long(texts.size());
    FeatMat X(N, model.dim());

    #pragma omp parallel for schedule(dynamic, 256)
    for (long i = 0; i < N; ++i)
        X.row(i) = vectorize(texts[i], model).transpose();

    return X;
}
