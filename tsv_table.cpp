#include <fstream>

#include "common.hpp"
#include "tsv_table.hpp"

TsvTable::TsvTable(std::vector<std::string> columns, std::vector<Row> rows)
    : cols_(std::move(columns)), rows_(std::move(rows))
{
    for (auto& r : rows_) r.resize(cols_.size());
}

/* -----------------------------------------------------------
 *  parse_line()
 *    split on `sep`; a field opening with '"' runs to the
 *    matching quote ("" = literal quote). Empty → null.
 * ----------------------------------------------------------- */
TsvTable::Row TsvTable::parse_line(const std::string& line, char sep)
{
    Row out;
    std::string cur;
    size_t i = 0, n = line.size();
    if (n && line[n - 1] == '\r') --n;                   // CRLF files

    while (true) {
        cur.clear();
        if (i < n && line[i] == '"') {
            ++i;
            while (i < n) {
                if (line[i] == '"') {
                    if (i + 1 < n && line[i + 1] == '"') { cur += '"'; i += 2; }
                    else { ++i; break; }
                } else cur += line[i++];
            }
            /* junk after the closing quote is kept verbatim */
            while (i < n && line[i] != sep) cur += line[i++];
        } else {
            while (i < n && line[i] != sep) cur += line[i++];
        }
        out.push_back(cur.empty() ? Cell{} : Cell{cur});
        if (i >= n) break;
        ++i;                                             // skip separator
        if (i == n) { out.push_back(Cell{}); break; }    // trailing sep
    }
    return out;
}

TsvTable TsvTable::read(const std::string& path, const ReadOpt& opt)
{
    std::ifstream fin(path);
    if (!fin) throw SourceUnavailable("cannot open " + path);

    std::string line;
    std::vector<std::string> cols;
    if (opt.header) {
        if (!std::getline(fin, line))
            throw ParseFailure("missing header row in " + path);
        for (auto& c : parse_line(line, opt.sep))
            cols.push_back(c ? trim(*c) : std::string());
        if (cols.empty() || (cols.size() == 1 && cols[0].empty()))
            throw ParseFailure("empty header row in " + path);
    }

    std::vector<Row> rows;
    while (std::getline(fin, line)) {
        if (line.empty() || line == "\r") continue;
        Row r = parse_line(line, opt.sep);
        if (!opt.header && r.size() > cols.size())
            for (size_t c = cols.size(); c < r.size(); ++c)
                cols.push_back("_c" + std::to_string(c));
        rows.push_back(std::move(r));
    }
    if (fin.bad()) throw SourceUnavailable("read error on " + path);

    return TsvTable(std::move(cols), std::move(rows));   // pads / truncates
}

bool TsvTable::has_column(const std::string& name) const
{
    return column_index(name) >= 0;
}

int TsvTable::column_index(const std::string& name) const
{
    for (size_t i = 0; i < cols_.size(); ++i)
        if (cols_[i] == name) return int(i);
    return -1;
}

TsvTable TsvTable::filter(const std::function<bool(const Row&)>& pred) const
{
    const long N = long(rows_.size());
    std::vector<char> keep(rows_.size(), 0);

    #pragma omp parallel for schedule(static)
    for (long i = 0; i < N; ++i)
        keep[i] = pred(rows_[i]) ? 1 : 0;

    std::vector<Row> out;
    out.reserve(rows_.size());
    for (long i = 0; i < N; ++i)
        if (keep[i]) out.push_back(rows_[i]);
    return TsvTable(cols_, std::move(out));
}

TsvTable TsvTable::with_column(const std::string& name,
                               const std::function<Cell(const Row&)>& fn) const
{
    const long N = long(rows_.size());
    std::vector<Cell> vals(rows_.size());

    #pragma omp parallel for schedule(static)
    for (long i = 0; i < N; ++i)
        vals[i] = fn(rows_[i]);

    std::vector<std::string> cols = cols_;
    int at = column_index(name);
    if (at < 0) { cols.push_back(name); at = int(cols.size()) - 1; }

    std::vector<Row> rows = rows_;
    for (long i = 0; i < N; ++i) {
        rows[i].resize(cols.size());
        rows[i][at] = std::move(vals[i]);
    }
    return TsvTable(std::move(cols), std::move(rows));
}

TsvTable TsvTable::select(const std::vector<std::string>& names) const
{
    std::vector<int> idx;
    for (const auto& n : names) {
        int k = column_index(n);
        if (k < 0) throw ParseFailure("no such column: " + n);
        idx.push_back(k);
    }
    std::vector<Row> rows;
    rows.reserve(rows_.size());
    for (const auto& r : rows_) {
        Row o;
        o.reserve(idx.size());
        for (int k : idx) o.push_back(r[k]);
        rows.push_back(std::move(o));
    }
    return TsvTable(names, std::move(rows));
}
