#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

#include "report.hpp"

using json = nlohmann::json;
using namespace std;

namespace {

string fmt(double v, int prec = 4)
{
    if (std::isnan(v)) return "n/a";
    ostringstream os;
    os << fixed << setprecision(prec) << v;
    return os.str();
}

/* JSON has no NaN */
json num_or_null(double v) { return std::isnan(v) ? json(nullptr) : json(v); }

string csv_quote(const string& s)
{
    if (s.find_first_of(",\"\n") == string::npos) return s;
    string out = "\"";
    for (char c : s) { if (c == '"') out += '"'; out += c; }
    return out + '"';
}

string marks(const TableEntry& e)
{
    string m;
    if (e.ok() && !e.metrics.labels_authoritative) m += '*';
    if (e.fallback_data)                            m += '!';
    return m;
}

} // namespace


void print_table(const ComparisonTable& table, ostream& os)
{
    const int W = 18;
    os << left << setw(W) << "Model" << setw(8) << "Status"
       << right << setw(10) << "Accuracy" << setw(11) << "Precision"
       << setw(10) << "Recall" << setw(10) << "F1" << setw(10) << "AUC"
       << setw(12) << "Train[s]" << '\n'
       << string(W + 8 + 10 + 11 + 10 + 10 + 10 + 12, '-') << '\n';

    bool any_star = false, any_bang = false;
    for (const auto& e : table.rows()) {
        const string name = e.variant + marks(e);
        any_star |= e.ok() && !e.metrics.labels_authoritative;
        any_bang |= e.fallback_data;

        os << left << setw(W) << name;
        if (!e.ok()) {
            os << setw(8) << "FAILED" << stage_name(e.stage) << ": " << e.error
               << '\n';
            continue;
        }
        const Metrics& m = e.metrics;
        os << setw(8) << "ok" << right
           << setw(10) << fmt(m.accuracy) << setw(11) << fmt(m.precision)
           << setw(10) << fmt(m.recall)   << setw(10) << fmt(m.f1)
           << setw(10) << fmt(m.auc)      << setw(12) << fmt(m.training_time_seconds, 2)
           << '\n';
    }
    if (any_star) os << "  * scored against placeholder labels (not ground truth)\n";
    if (any_bang) os << "  ! built-in sample data, scores are not meaningful\n";

    const string best = best_by_f1(table);
    if (!best.empty()) os << "best by F1: " << best << '\n';
}


void write_json(const ComparisonTable& table, const string& path)
{
    json j = json::array();
    for (const auto& e : table.rows()) {
        json r;
        r["model"]         = e.variant;
        r["status"]        = e.ok() ? "ok" : "failed";
        r["fallback_data"] = e.fallback_data;
        if (e.ok()) {
            const Metrics& m = e.metrics;
            r["accuracy"]  = num_or_null(m.accuracy);
            r["precision"] = num_or_null(m.precision);
            r["recall"]    = num_or_null(m.recall);
            r["f1"]        = num_or_null(m.f1);
            r["auc"]       = num_or_null(m.auc);
            r["training_time_seconds"] = m.training_time_seconds;
            r["feature_seconds"]       = m.feature_seconds;
            r["fit_seconds"]           = m.fit_seconds;
            r["labels_authoritative"]  = m.labels_authoritative;
        } else {
            r["stage"] = stage_name(e.stage);
            r["error"] = e.error;
        }
        j.push_back(r);
    }

    ofstream out(path);
    if (!out) throw runtime_error("cannot write " + path);
    out << j.dump(2) << '\n';
    if (!out) throw runtime_error("write failed on " + path);
    logI("results JSON → " + path);
}


void write_csv(const ComparisonTable& table, const string& path)
{
    ofstream out(path);
    if (!out) throw runtime_error("cannot write " + path);
    out << "model,status,accuracy,precision,recall,f1,auc,"
           "training_time_seconds,labels_authoritative,fallback_data,stage,error\n";
    for (const auto& e : table.rows()) {
        out << csv_quote(e.variant) << ',' << (e.ok() ? "ok" : "failed") << ',';
        if (e.ok()) {
            const Metrics& m = e.metrics;
            out << fmt(m.accuracy, 6) << ',' << fmt(m.precision, 6) << ','
                << fmt(m.recall, 6)   << ',' << fmt(m.f1, 6)        << ','
                << fmt(m.auc, 6)      << ',' << fmt(m.training_time_seconds, 6) << ','
                << (m.labels_authoritative ? "true" : "false") << ','
                << (e.fallback_data ? "true" : "false") << ",,\n";
        } else {
            out << ",,,,,,," << (e.fallback_data ? "true" : "false") << ','
                << stage_name(e.stage) << ',' << csv_quote(e.error) << '\n';
        }
    }
    if (!out) throw runtime_error("write failed on " + path);
    logI("results CSV → " + path);
}


string best_by_f1(const ComparisonTable& table)
{
    const TableEntry* best = nullptr;
    for (const auto& e : table.rows())
        if (e.ok() && (!best || e.metrics.f1 > best->metrics.f1)) best = &e;
    return best ? best->variant : "";
}
