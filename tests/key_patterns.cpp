#include <doctest/doctest.h>
#include "tessera/key_patterns.hpp"

using namespace tessera;

TEST_CASE("TrieNode - Children") {
    TrieNode node;
    CHECK_FALSE(node.isTerminal);
    CHECK(node.getChild('a') == nullptr);

    TrieNode* child = node.getOrCreateChild('a');
    REQUIRE(child != nullptr);
    CHECK(node.getChild('a') == child);
    CHECK(node.getOrCreateChild('a') == child);

    // High bytes index the same table
    CHECK(node.getOrCreateChild(static_cast<char>(0xFF)) != nullptr);
    CHECK(node.getChild(static_cast<char>(0xFE)) == nullptr);
}

TEST_CASE("PrefixTrie - Lookup") {
    PrefixTrie trie;
    trie.insert("users/");
    trie.insert("users/admin/");
    CHECK(trie.size() == 2);

    CHECK(trie.containsPrefix("users/42"));
    CHECK(trie.containsPrefix("users/"));
    CHECK_FALSE(trie.containsPrefix("user"));
    CHECK_FALSE(trie.containsPrefix("groups/1"));

    CHECK(trie.containsPrefix("users/admin/root"));

    trie.insert("users/");
    CHECK(trie.size() == 2);
}

TEST_CASE("SuffixTrie - Lookup") {
    SuffixTrie trie;
    trie.insert(".json");
    trie.insert(".min.json");
    CHECK(trie.size() == 2);

    CHECK(trie.containsSuffix("config.json"));
    CHECK_FALSE(trie.containsSuffix("config.yaml"));
    CHECK_FALSE(trie.containsSuffix("json"));
    CHECK(trie.containsSuffix("app.min.json"));
}

TEST_CASE("KeyPatternMatcher - Pattern kinds") {
    KeyPatternMatcher matcher;
    CHECK(matcher.empty());

    matcher.addPattern("settings");
    matcher.addPattern("docs/*");
    matcher.addPattern("*.png");
    CHECK_FALSE(matcher.empty());

    SUBCASE("Exact") {
        CHECK(matcher.matches("settings"));
        CHECK_FALSE(matcher.matches("settings2"));
    }

    SUBCASE("Prefix") {
        CHECK(matcher.matches("docs/readme"));
        CHECK(matcher.matches("docs/"));
        CHECK_FALSE(matcher.matches("doc"));
    }

    SUBCASE("Suffix") {
        CHECK(matcher.matches("images/cat.png"));
        CHECK_FALSE(matcher.matches("images/cat.jpg"));
    }

    SUBCASE("Unmatched") {
        CHECK_FALSE(matcher.matches("other"));
        CHECK_FALSE(matcher.matches(""));
    }
}

TEST_CASE("KeyPatternMatcher - Wildcard matches everything") {
    KeyPatternMatcher matcher;
    matcher.addPattern("*");
    CHECK_FALSE(matcher.empty());
    CHECK(matcher.matches(""));
    CHECK(matcher.matches("anything/at/all"));
}

TEST_CASE("KeyPatternMatcher - Move only") {
    KeyPatternMatcher matcher;
    matcher.addPattern("a/*");
    KeyPatternMatcher moved = std::move(matcher);
    CHECK(moved.matches("a/b"));
}
