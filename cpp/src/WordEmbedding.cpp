/**
 * =============================================================================
 * WordEmbedding.cpp - Embedding Table Implementation
 * =============================================================================
 *
 * @file WordEmbedding.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "WordEmbedding.hpp"

#include <stdexcept>

WordEmbedding::WordEmbedding(int vocabSize, int embedSize, std::mt19937& rng, const std::string& name) {
    if (vocabSize < 1 || embedSize < 1) {
        throw std::invalid_argument(name + ": vocabulary and embedding sizes must be positive");
    }

    table.name = name + ".weight";
    table.value.resize(vocabSize, embedSize);
    ParameterInit::normal(table.value, rng);
}

Matrix WordEmbedding::lookup(const std::vector<int64_t>& tokens) const {
    Matrix rows(static_cast<Eigen::Index>(tokens.size()), table.value.cols());
    for (size_t i = 0; i < tokens.size(); ++i) {
        checkIndex(tokens[i]);
        rows.row(static_cast<Eigen::Index>(i)) = table.value.row(static_cast<Eigen::Index>(tokens[i]));
    }
    return rows;
}

Matrix WordEmbedding::lookup(int64_t token) const {
    checkIndex(token);
    return table.value.row(static_cast<Eigen::Index>(token));
}

std::vector<Parameter*> WordEmbedding::parameters() {
    return {&table};
}

void WordEmbedding::checkIndex(int64_t token) const {
    if (token < 0 || token >= table.value.rows()) {
        throw std::invalid_argument(
            table.name + ": token index " + std::to_string(token) +
            " outside vocabulary of size " + std::to_string(table.value.rows()));
    }
}
