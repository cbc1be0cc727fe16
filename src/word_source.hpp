#pragma once
/*
 * WordSource
 *
 * Purpose: supply a label no longer than max_len for a receipt line.
 * Goal: decouple the formatter from randomness so it stays deterministic under test.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

class IWordSource {
public:
  virtual ~IWordSource() = default;
  virtual std::optional<std::string> select(size_t max_len) = 0;
};

// Uniform pick among the kid-room vocabulary; repeats within one receipt are allowed.
class RandomWordSource : public IWordSource {
public:
  explicit RandomWordSource(uint32_t seed = std::random_device{}());
  RandomWordSource(std::vector<std::string> words, uint32_t seed);
  std::optional<std::string> select(size_t max_len) override;
  const std::vector<std::string>& words() const { return words_; }
  static const std::vector<std::string>& default_words();
private:
  std::vector<std::string> words_;
  std::mt19937 rng_;
};
