/* ──────────────────────────────────────────────────────────────
   embedding.hpp  –  sub-word skip-gram embeddings + averaging
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "common.hpp"

struct EmbedOpt {
    int      dim       = DEFAULT_DIM;
    int      window    = 5;
    int      min_count = 1;
    int      epochs    = 3;
    int      negative  = 5;
    int      min_n     = 3;        // char n-gram range, max_n = 0 disables
    int      max_n     = 6;
    int      bucket    = 100000;   // hashed n-gram slots
    double   sample    = 1e-3;     // frequent-word down-sampling
    double   alpha     = 0.025;
    double   min_alpha = 1e-4;
    uint32_t seed      = 1;
};

class EmbeddingModel;

/* lower-case + whitespace split */
std::vector<std::string> tokenize(const std::string& text);

/* hashed sub-word ids of `word` (fastText layout: "<word>") */
std::vector<int> subword_ids(const std::string& word, int min_n, int max_n,
                             int bucket);

/*  Trains on `texts` only.  Same texts + same opt ⇒ same model.
    throws InvalidInput on nonsensical options                  */
EmbeddingModel train_embedding(const std::vector<std::string>& texts,
                               const EmbedOpt& opt);

/* mean of in-vocabulary token vectors; zero vector if none */
FeatVec vectorize(const std::string& text, const EmbeddingModel& model);

/* one row per text, rows computed in parallel */
FeatMat vectorize_all(const std::vector<std::string>& texts,
                      const EmbeddingModel& model);


/*  Read-only after training: no public mutators.  */
class EmbeddingModel {
public:
    int         dim()        const { return dim_; }
    std::size_t vocab_size() const { return words_.size(); }

    bool contains(const std::string& word) const {
        return index_.count(word) != 0;
    }
    /* -1 when out of vocabulary */
    int  index(const std::string& word) const;

    /* vocabulary in index order (most frequent first) */
    const std::vector<std::string>& vocabulary() const { return words_; }

    /* final (word + sub-word) vectors, one row per vocabulary entry */
    const FeatMat& vectors() const { return vecs_; }

    /* word2vec text format: "<V> <dim>" then "<word> v1 ... vd" */
    void save_vec(const std::string& path) const;

private:
    friend EmbeddingModel train_embedding(const std::vector<std::string>&,
                                          const EmbedOpt&);
    explicit EmbeddingModel(int dim) : dim_(dim) {}

    int                                  dim_;
    std::vector<std::string>             words_;
    std::unordered_map<std::string, int> index_;
    FeatMat                              vecs_;
};
