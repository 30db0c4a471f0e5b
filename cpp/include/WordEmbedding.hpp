/**
 * =============================================================================
 * WordEmbedding.hpp - Token Index → Dense Vector Lookup Table
 * =============================================================================
 *
 * The table has one row per vocabulary entry:
 *
 *   table: [vocabSize, embedSize]
 *   lookup(token) = table.row(token)
 *
 * The decoder feeds these rows to the LSTM: ground-truth tokens during
 * training, its own predictions during sampling.
 *
 * @file WordEmbedding.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef WORD_EMBEDDING_HPP
#define WORD_EMBEDDING_HPP

#include "Parameter.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

class WordEmbedding {
public:
    /**
     * Create a table with entries drawn from N(0, 1).
     *
     * @throws std::invalid_argument if either size is not positive
     */
    WordEmbedding(int vocabSize, int embedSize, std::mt19937& rng, const std::string& name);

    /**
     * Look up a batch of tokens.
     *
     * @param tokens One token index per batch row
     * @return [tokens.size(), embedSize]
     * @throws std::invalid_argument if any index is outside [0, vocabSize)
     */
    Matrix lookup(const std::vector<int64_t>& tokens) const;

    /** Single-token lookup, returned as a [1, embedSize] matrix */
    Matrix lookup(int64_t token) const;

    int vocabSize() const { return static_cast<int>(table.value.rows()); }
    int embedSize() const { return static_cast<int>(table.value.cols()); }

    std::vector<Parameter*> parameters();

private:
    void checkIndex(int64_t token) const;

    Parameter table;
};

#endif // WORD_EMBEDDING_HPP
