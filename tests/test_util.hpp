#pragma once
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "common.hpp"

/* writes `body` to <gtest tmp>/<name> and returns the path */
inline std::string write_tmp(const std::string& name, const std::string& body)
{
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << body;
    return path;
}

/* two gaussian blobs around ±1 on every axis, labels 1 / 0 */
inline void make_blobs(int n, int dim, FeatMat& X, std::vector<float>& y,
                       uint32_t seed = 7)
{
    std::mt19937 rng(seed);
    std::normal_distribution<float> noise(0.f, 0.3f);
    X.resize(n, dim);
    y.resize(size_t(n));
    for (int i = 0; i < n; ++i) {
        const float c = (i % 2) ? 1.f : -1.f;
        for (int d = 0; d < dim; ++d) X(i, d) = c + noise(rng);
        y[size_t(i)] = (i % 2) ? 1.f : 0.f;
    }
}
