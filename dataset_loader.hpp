/* ──────────────────────────────────────────────────────────────
   dataset_loader.hpp  –  question-pair TSV → Dataset
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>

#include "common.hpp"

/*  Reads a QQP-style TSV (question1, question2[, is_duplicate]).

    - training sources keep rows whose is_duplicate casts to 0.0 / 1.0
    - evaluation sources get the placeholder label 0.0 and are tagged
      labels_authoritative = false
    - SourceUnavailable / ParseFailure are absorbed: the built-in sample
      is returned with provenance Fallback
    - EmptyDataset (rows read, none kept) propagates                    */
Dataset load_dataset(const std::string& path, bool is_evaluation_set);

/* the 3-record built-in sample, labels {1, 0, 1} */
Dataset fallback_dataset(const std::string& source = "");

/* "q1 [SEP] q2" with null parts skipped; empty if both are null */
std::string join_pair(const std::string* q1, const std::string* q2);
