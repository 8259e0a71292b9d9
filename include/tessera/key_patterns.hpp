/**
 * @file key_patterns.hpp
 * @brief Trie-backed matching of storage keys against grant key patterns
 */

#pragma once

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>

namespace tessera {

/**
 * @brief Trie node with a flat child table covering every byte value
 */
struct TrieNode {
  static constexpr size_t BYTE_SIZE = 256;

  std::array<std::unique_ptr<TrieNode>, BYTE_SIZE> children{};
  bool isTerminal = false;

  /**
   * @return Non-owning pointer to the child, or nullptr
   */
  TrieNode* getChild(char c) const noexcept {
    return children[static_cast<unsigned char>(c)].get();
  }

  TrieNode* getOrCreateChild(char c) {
    auto& slot = children[static_cast<unsigned char>(c)];
    if (!slot) {
      slot = std::make_unique<TrieNode>();
    }
    return slot.get();
  }
};

/**
 * @brief Stores literal prefixes; answers "which stored prefixes start text"
 */
class PrefixTrie {
 public:
  PrefixTrie() : root_(std::make_unique<TrieNode>()) {}

  void insert(std::string_view prefix);
  bool containsPrefix(std::string_view text) const;
  size_t size() const noexcept { return size_; }

 private:
  std::unique_ptr<TrieNode> root_;
  size_t size_ = 0;
};

/**
 * @brief Stores literal suffixes, walked from the last byte backwards
 */
class SuffixTrie {
 public:
  SuffixTrie() : root_(std::make_unique<TrieNode>()) {}

  void insert(std::string_view suffix);
  bool containsSuffix(std::string_view text) const;
  size_t size() const noexcept { return size_; }

 private:
  std::unique_ptr<TrieNode> root_;
  size_t size_ = 0;
};

/**
 * @brief Matcher for grant key patterns
 *
 * Pattern syntax:
 *   "*"        any key
 *   "prefix*"  keys starting with prefix
 *   "*suffix"  keys ending with suffix
 *   otherwise  the exact key
 */
class KeyPatternMatcher {
 public:
  void addPattern(std::string_view pattern);
  bool matches(std::string_view key) const;

  bool empty() const noexcept {
    return !matchAll_ && exact_.empty() && prefixes_.size() == 0 &&
           suffixes_.size() == 0;
  }

 private:
  bool matchAll_ = false;
  std::unordered_set<std::string> exact_;
  PrefixTrie prefixes_;
  SuffixTrie suffixes_;
};

}  // namespace tessera
