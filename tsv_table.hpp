/* ──────────────────────────────────────────────────────────────
   tsv_table.hpp  –  tiny column-named table over delimited text
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct ReadOpt {
    char sep    = '\t';
    bool header = true;      // first line names the columns
};

/*  Immutable: every transformation returns a new table.
    Cells are nullable; an empty field reads as null.           */
class TsvTable {
public:
    using Cell = std::optional<std::string>;
    using Row  = std::vector<Cell>;

    TsvTable() = default;
    TsvTable(std::vector<std::string> columns, std::vector<Row> rows);

    /* throws SourceUnavailable / ParseFailure */
    static TsvTable read(const std::string& path, const ReadOpt& opt = {});
    static Row      parse_line(const std::string& line, char sep);

    const std::vector<std::string>& columns() const { return cols_; }
    bool has_column  (const std::string& name) const;
    int  column_index(const std::string& name) const;     // -1 if absent

    /*  row callbacks may run concurrently – keep them pure  */
    TsvTable filter     (const std::function<bool(const Row&)>& pred) const;
    TsvTable with_column(const std::string& name,
                         const std::function<Cell(const Row&)>& fn) const;
    TsvTable select     (const std::vector<std::string>& names) const;

    std::size_t count() const { return rows_.size(); }
    const std::vector<Row>& to_local() const { return rows_; }

private:
    std::vector<std::string> cols_;
    std::vector<Row>         rows_;
};
