#include "tessera/key_patterns.hpp"

namespace tessera {

namespace {

template <typename Iter>
TrieNode* insertPath(TrieNode* root, Iter begin, Iter end) {
  TrieNode* current = root;
  for (auto it = begin; it != end; ++it) {
    current = current->getOrCreateChild(*it);
  }
  return current;
}

template <typename Iter>
bool walkAny(const TrieNode* root, Iter begin, Iter end) {
  const TrieNode* current = root;
  for (auto it = begin; it != end; ++it) {
    current = current->getChild(*it);
    if (!current) return false;
    if (current->isTerminal) return true;
  }
  return false;
}

}  // namespace

void PrefixTrie::insert(std::string_view prefix) {
  TrieNode* node = insertPath(root_.get(), prefix.begin(), prefix.end());
  if (!node->isTerminal) {
    ++size_;
  }
  node->isTerminal = true;
}

bool PrefixTrie::containsPrefix(std::string_view text) const {
  return walkAny(root_.get(), text.begin(), text.end());
}

void SuffixTrie::insert(std::string_view suffix) {
  TrieNode* node = insertPath(root_.get(), suffix.rbegin(), suffix.rend());
  if (!node->isTerminal) {
    ++size_;
  }
  node->isTerminal = true;
}

bool SuffixTrie::containsSuffix(std::string_view text) const {
  return walkAny(root_.get(), text.rbegin(), text.rend());
}

void KeyPatternMatcher::addPattern(std::string_view pattern) {
  if (pattern == "*") {
    matchAll_ = true;
  } else if (pattern.size() > 1 && pattern.back() == '*') {
    prefixes_.insert(pattern.substr(0, pattern.size() - 1));
  } else if (pattern.size() > 1 && pattern.front() == '*') {
    suffixes_.insert(pattern.substr(1));
  } else {
    exact_.emplace(pattern);
  }
}

bool KeyPatternMatcher::matches(std::string_view key) const {
  if (matchAll_) return true;
  if (exact_.count(std::string(key)) > 0) return true;
  return prefixes_.containsPrefix(key) || suffixes_.containsSuffix(key);
}

}  // namespace tessera
