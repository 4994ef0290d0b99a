#pragma once
#include <string>

// Similarity scores (0..100) backed by rapidfuzz.
namespace fuzzy
{
// rapidfuzz default processing: lowercased, non-alphanumerics turned into spaces, trimmed.
std::string preprocess(const std::string& text);

// Normalized Indel similarity of the raw strings.
double ratio(const std::string& a, const std::string& b);

// Token-sort ratio of both inputs after preprocess(), so that
// "Kingdom United" and "united kingdom" score 100.
double token_sort_ratio(const std::string& a, const std::string& b);
} // namespace fuzzy
