/*───────────────────────────────────────────────────────────
 *  common.hpp   –  shared types, errors, logging
 *───────────────────────────────────────────────────────────*/
#pragma once

/* ---------- STL ---------- */
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/* ---------- deps ---------- */
#include <Eigen/Dense>

/* ---------- global constants ---------- */
constexpr const char* SEP_TOKEN   = " [SEP] ";   // question1 <SEP> question2
constexpr int         DEFAULT_DIM = 100;         // embedding / feature dim

/* ────────────────── feature containers ────────────────── */
using FeatVec = Eigen::VectorXf;
using FeatMat = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic,
                              Eigen::RowMajor>;    // one row per record

/* ────────────────── error taxonomy ────────────────── */
struct BenchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
/* source cannot be opened / reached */
struct SourceUnavailable : BenchError { using BenchError::BenchError; };
/* source readable but not in the expected shape */
struct ParseFailure      : BenchError { using BenchError::BenchError; };
/* rows existed but none survived filtering */
struct EmptyDataset      : BenchError { using BenchError::BenchError; };
/* precondition violated by a trainer / evaluator / vectorizer call */
struct InvalidInput      : BenchError { using BenchError::BenchError; };

/* ────────────────── records / datasets ────────────────── */
struct Record {
    std::string text;
    float       label = 0.f;       // 0.0 or 1.0
};

enum class Provenance { Real, Fallback };
const char* provenance_name(Provenance p);

class Dataset {
public:
    Dataset() = default;
    Dataset(std::vector<Record> records,
            Provenance          prov,
            bool                labels_authoritative,
            std::string         source);

    std::size_t count() const { return records_.size(); }
    bool        empty() const { return records_.empty(); }

    const std::vector<Record>& records() const { return records_; }
    Provenance  provenance()           const { return prov_; }
    bool        is_fallback()          const { return prov_ == Provenance::Fallback; }
    bool        labels_authoritative() const { return labels_ok_; }
    const std::string& source()        const { return source_; }

    std::vector<std::string> texts()  const;
    std::vector<float>       labels() const;

private:
    std::vector<Record> records_;
    Provenance          prov_      = Provenance::Real;
    bool                labels_ok_ = true;
    std::string         source_;
};

/* label → #records, sorted by label */
std::map<float, std::size_t> label_histogram(const Dataset& ds);

/* ────────────────── log / progress & file helpers ────────────────── */
void logI(const std::string& msg);
void logW(const std::string& msg);
void logE(const std::string& msg);

bool file_exists (const std::string& path);
bool is_directory(const std::string& path);
bool ensure_dir  (const std::string& path);   // mkdir -p (one level)

void progress(const std::string& tag,
              std::size_t cur, std::size_t tot, std::size_t barWidth = 40);

/* wall clock, seconds */
double now_sec();

/* ────────────────── string / numeric helpers ────────────────── */
std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string& s, char sep);

/* strict number parse: whole (trimmed) string must be consumed */
bool parse_double(const std::string& s, double& out);
