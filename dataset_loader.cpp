/* -----------------------------------------------------------
 *  dataset_loader.cpp – load_dataset() & the fallback sample
 * ----------------------------------------------------------- */
#include <sstream>

#include "dataset_loader.hpp"
#include "tsv_table.hpp"

namespace {

using Cell = TsvTable::Cell;
using Row  = TsvTable::Row;

void log_filtered(const std::string& what, size_t before, size_t after)
{
    if (after == before) return;
    std::ostringstream os;
    os << "label filter (" << what << ") dropped " << (before - after)
       << " rows: " << before << " -> " << after;
    logW(os.str());
}

/* the raw text survives only if it casts to a number */
Cell cast_label(const Cell& raw)
{
    double v = 0.0;
    if (!raw || !parse_double(*raw, v)) return Cell{};
    return Cell{trim(*raw)};
}

double label_value(const Cell& c)
{
    double v = -1.0;
    if (c) parse_double(*c, v);
    return v;
}

} // namespace

std::string join_pair(const std::string* q1, const std::string* q2)
{
    std::string out;
    if (q1) out = *q1;
    if (q2) {
        if (q1) out += SEP_TOKEN;
        out += *q2;
    }
    return out;
}

Dataset fallback_dataset(const std::string& source)
{
    std::vector<Record> recs{
        {"How do I improve my English? [SEP] What are some ways to improve my English?", 1.f},
        {"What is the capital of France? [SEP] What is the population of Germany?",      0.f},
        {"How to lose weight fast? [SEP] What are some effective ways to lose weight quickly?", 1.f},
    };
    return Dataset(std::move(recs), Provenance::Fallback, true,
                   source.empty() ? "<built-in sample>" : source);
}

Dataset load_dataset(const std::string& path, bool is_evaluation_set)
{
    logI("Loading dataset from " + path + "...");
    try {
        TsvTable data = TsvTable::read(path);
        const size_t rows_read = data.count();
        if (rows_read == 0)
            throw ParseFailure("no data rows in " + path);

        const int q1 = data.column_index("question1");
        const int q2 = data.column_index("question2");
        if (q1 < 0 || q2 < 0)
            throw ParseFailure("question1 / question2 columns missing in " + path);

        /* ---- labels ------------------------------------------------ */
        if (!is_evaluation_set) {
            const int dup = data.column_index("is_duplicate");
            if (dup < 0)
                throw ParseFailure("is_duplicate column missing in training source " + path);

            data = data.with_column("label",
                    [dup](const Row& r) { return cast_label(r[dup]); });
            const int lab = data.column_index("label");

            size_t before = data.count();
            data = data.filter([lab](const Row& r) { return r[lab].has_value(); });
            log_filtered("null / unparseable", before, data.count());

            before = data.count();
            data = data.filter([lab](const Row& r) {
                const double v = label_value(r[lab]);
                return v == 0.0 || v == 1.0;
            });
            log_filtered("not 0/1", before, data.count());
        } else {
            data = data.with_column("label",
                    [](const Row&) { return Cell{"0"}; });
        }

        /* ---- text -------------------------------------------------- */
        data = data.with_column("text", [q1, q2](const Row& r) {
            std::string t = join_pair(r[q1] ? &*r[q1] : nullptr,
                                      r[q2] ? &*r[q2] : nullptr);
            return t.empty() ? Cell{} : Cell{t};
        });
        data = data.select({"text", "label"})
                   .filter([](const Row& r) { return r[0].has_value(); });

        if (data.count() == 0)
            throw EmptyDataset("dataset is empty after filtering (" +
                               std::to_string(rows_read) + " rows read from " +
                               path + "); check the input file and filters");

        std::vector<Record> recs;
        recs.reserve(data.count());
        for (const auto& r : data.to_local())
            recs.push_back({*r[0], label_value(r[1]) == 1.0 ? 1.f : 0.f});

        logI("Loaded " + std::to_string(recs.size()) + " of " +
             std::to_string(rows_read) + " rows from " + path);
        return Dataset(std::move(recs), Provenance::Real, !is_evaluation_set, path);
    }
    catch (const SourceUnavailable& e) {
        logW(std::string("error while loading data: ") + e.what());
    }
    catch (const ParseFailure& e) {
        logW(std::string("error while loading data: ") + e.what());
    }
    logW("using the built-in sample dataset – results are NOT meaningful");
    return fallback_dataset(path);
}
