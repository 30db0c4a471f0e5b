/**
 * =============================================================================
 * CaptionFormatter.hpp - Token Indices → Readable Caption
 * =============================================================================
 *
 * The decoder only produces integers. To print a caption, the command-line
 * tool maps each index to a word using a plain word list:
 *
 *   line 0: <start>
 *   line 1: <end>
 *   line 2: a
 *   ...
 *
 * The word on line i is token i. Start and end markers are left out of the
 * formatted text.
 *
 * @file CaptionFormatter.hpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#ifndef CAPTION_FORMATTER_HPP
#define CAPTION_FORMATTER_HPP

#include <cstdint>
#include <string>
#include <vector>

class CaptionFormatter {
public:
    CaptionFormatter(int64_t startIndex = 0, int64_t endIndex = 1);

    /**
     * Load a word list, one token per line.
     *
     * Empty lines still count as entries, so line numbers stay aligned with
     * token indices.
     *
     * @return true if the file was read, false if it could not be opened
     *         (a warning is logged and placeholder words are used)
     */
    bool loadWords(const std::string& path);

    /** Word for a token, or "token_<index>" if the list does not cover it */
    std::string word(int index) const;

    /** Space-separated words, start/end markers dropped */
    std::string format(const std::vector<int>& tokens) const;

    size_t size() const { return words.size(); }

private:
    int64_t startToken;
    int64_t endToken;
    std::vector<std::string> words;
};

#endif // CAPTION_FORMATTER_HPP
