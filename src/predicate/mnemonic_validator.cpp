#include "mnemonic_sieve/predicate.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <memory>
#include <utility>

namespace ms {

static inline bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_ascii_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_ascii_space(s.back()))  s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> split_words(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_ascii_space(s[i])) ++i;
    std::size_t j = i;
    while (j < s.size() && !is_ascii_space(s[j])) ++j;
    if (j > i) out.emplace_back(s.substr(i, j - i));
    i = j;
  }
  return out;
}

bool MnemonicValidator::load_wordlist(const std::string& path, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open wordlist '" + path + "'";
    return false;
  }
  std::vector<std::string> words;
  words.reserve(kWordCount);
  std::string line;
  while (std::getline(in, line)) {
    auto w = trim(line);
    if (!w.empty()) words.emplace_back(w);
  }
  if (in.bad()) {
    if (err) *err = "read failed on wordlist '" + path + "'";
    return false;
  }
  std::string why;
  if (!set_wordlist(std::move(words), &why)) {
    if (err) *err = "wordlist '" + path + "': " + why;
    return false;
  }
  return true;
}

bool MnemonicValidator::set_wordlist(std::vector<std::string> words, std::string* err) {
  if (words.size() != kWordCount) {
    if (err) *err = "expected 2048 words, got " + std::to_string(words.size());
    return false;
  }
  std::unordered_map<std::string, std::uint16_t> idx;
  idx.reserve(kWordCount);
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (!idx.emplace(words[i], static_cast<std::uint16_t>(i)).second) {
      if (err) *err = "duplicate word '" + words[i] + "'";
      return false;
    }
  }
  words_ = std::move(words);
  index_ = std::move(idx);
  return true;
}

bool MnemonicValidator::is_valid(std::string_view phrase) const {
  if (!loaded()) return false;
  const auto words = split_words(phrase);
  const std::size_t n = words.size();
  if (n < 12 || n > 24 || n % 3 != 0) return false;

  // 24 words * 11 bits = 264 bits = 33 bytes
  unsigned char bits[33] = {0};
  std::size_t bit = 0;
  std::string key;
  for (auto w : words) {
    key.assign(w.data(), w.size());
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    for (int b = 10; b >= 0; --b, ++bit) {
      if ((it->second >> b) & 1u) bits[bit / 8] |= static_cast<unsigned char>(0x80u >> (bit % 8));
    }
  }

  const std::size_t total_bits = n * 11;
  const std::size_t cs_bits = total_bits / 33;
  const std::size_t ent_bits = total_bits - cs_bits;

  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(bits, ent_bits / 8, md);

  for (std::size_t i = 0; i < cs_bits; ++i) {
    const bool want = (md[i / 8] >> (7 - i % 8)) & 1u;
    const std::size_t at = ent_bits + i;
    const bool got = (bits[at / 8] >> (7 - at % 8)) & 1u;
    if (want != got) return false;
  }
  return true;
}

LinePredicate MnemonicValidator::as_predicate() const {
  auto self = std::make_shared<const MnemonicValidator>(*this);
  return [self](std::string_view line) { return self->is_valid(line); };
}

}
