/**
 * =============================================================================
 * CaptionFormatter.cpp - Word List Loading and Caption Rendering
 * =============================================================================
 *
 * @file CaptionFormatter.cpp
 * @author Image Captioning Engine
 * @version 1.0.0
 */

#include "CaptionFormatter.hpp"

#include <fstream>
#include <iostream>

CaptionFormatter::CaptionFormatter(int64_t startIndex, int64_t endIndex)
    : startToken(startIndex)
    , endToken(endIndex)
{
}

bool CaptionFormatter::loadWords(const std::string& path) {
    std::ifstream file(path);

    if (!file.is_open()) {
        std::cerr << "Warning: Could not load word list from " << path << std::endl;
        words.clear();
        return false;
    }

    words.clear();
    std::string line;
    while (std::getline(file, line)) {
        // Tolerate word lists written on Windows
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        words.push_back(line);
    }

    std::cout << "Loaded " << words.size() << " words" << std::endl;
    return true;
}

std::string CaptionFormatter::word(int index) const {
    if (index >= 0 && index < static_cast<int>(words.size())) {
        return words[index];
    }
    return "token_" + std::to_string(index);
}

std::string CaptionFormatter::format(const std::vector<int>& tokens) const {
    std::string text;
    for (int token : tokens) {
        if (token == startToken || token == endToken) {
            continue;
        }
        if (!text.empty()) {
            text += ' ';
        }
        text += word(token);
    }
    return text;
}
