/* ──────────────────────────────────────────────────────────────
   report.hpp  –  ComparisonTable → text / JSON / CSV
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <ostream>
#include <string>

#include "benchmark.hpp"

/*  fixed-width table; failed rows show stage + error,
    '*' = scored against placeholder labels,
    '!' = built-in sample data                           */
void print_table(const ComparisonTable& table, std::ostream& os);

/* throw std::runtime_error on I/O failure */
void write_json(const ComparisonTable& table, const std::string& path);
void write_csv (const ComparisonTable& table, const std::string& path);

/* best successful variant by F1, "" when none succeeded */
std::string best_by_f1(const ComparisonTable& table);
