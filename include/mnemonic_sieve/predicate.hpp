#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ms {

// Validity check applied to one trimmed line. Called concurrently from
// every worker; must be thread-safe and deterministic.
using LinePredicate = std::function<bool(std::string_view)>;

// BIP39 mnemonic check: 12/15/18/21/24 words from a 2048-word list whose
// 11-bit indices carry ENT entropy bits followed by ENT/32 bits of
// SHA-256(entropy). Immutable once loaded.
class MnemonicValidator {
public:
  static constexpr std::size_t kWordCount = 2048;

  // One word per line. False (with *err) unless exactly 2048 distinct words.
  bool load_wordlist(const std::string& path, std::string* err = nullptr);
  bool set_wordlist(std::vector<std::string> words, std::string* err = nullptr);

  bool is_valid(std::string_view phrase) const;

  bool loaded() const noexcept { return words_.size() == kWordCount; }
  const std::vector<std::string>& words() const noexcept { return words_; }

  LinePredicate as_predicate() const;

private:
  std::vector<std::string> words_;
  std::unordered_map<std::string, std::uint16_t> index_;
};

// Split on ASCII whitespace.
std::vector<std::string_view> split_words(std::string_view s);

// ASCII whitespace trim on both ends.
std::string_view trim(std::string_view s);

}
