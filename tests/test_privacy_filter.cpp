#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <string>

#include "typing_coach/errors.hpp"
#include "typing_coach/privacy_filter.hpp"
#include "typing_coach/word_detector.hpp"
#include "test_support.hpp"

using namespace tc::core;
using tc::test::makeHasher;

TEST_CASE("word hash is stable, keyed and case-insensitive", "[privacy]") {
    auto hasher = makeHasher();
    const auto h = hasher->hash("Secret");
    REQUIRE(WordHasher::isHashHex(h));
    REQUIRE(h == hasher->hash("secret"));
    REQUIRE(h == hasher->hash("SECRET"));
    REQUIRE(h != hasher->hash("secrets"));
    REQUIRE(h.find("secret") == std::string::npos);

    HashKey other_pepper = WordHasher::keyFromHex(tc::test::kPepperHex);
    other_pepper[0] ^= 0x01;
    WordHasher other(other_pepper, WordHasher::keyFromHex(tc::test::kUserKeyHex));
    REQUIRE(other.hash("secret") != h);

    HashKey other_user = WordHasher::keyFromHex(tc::test::kUserKeyHex);
    other_user[31] ^= 0x80;
    WordHasher other2(WordHasher::keyFromHex(tc::test::kPepperHex), other_user);
    REQUIRE(other2.hash("secret") != h);
}

TEST_CASE("word hash matches keyed BLAKE2b-256", "[privacy]") {
    // blake2b(user_salt || word, key=pepper, digest_size=32) with
    // user_salt = blake2b(label, key=user_key, digest_size=32).
    auto hasher = makeHasher();
    REQUIRE(hasher->hash("secret") == "e43ec48680716f4f3a977a4496e2521e1db7f62787167fd130de7af5e38bfda0");
    REQUIRE(hasher->hash("one") == "036df7e7f4af396ce2e062e80e86aac3531f49abf516adf017da189446eb633b");
}

TEST_CASE("one hasher serves many words and copies", "[privacy]") {
    auto hasher = makeHasher();
    for (int i = 0; i < 100; ++i) {
        (void)hasher->hash("word" + std::to_string(i));
    }
    const WordHasher copy = *hasher;
    REQUIRE(copy.hash("secret") == "e43ec48680716f4f3a977a4496e2521e1db7f62787167fd130de7af5e38bfda0");
    REQUIRE(hasher->hash("One") == copy.hash("one"));
}

TEST_CASE("hash keys must be 64 hex characters", "[privacy][config]") {
    REQUIRE_THROWS_AS(WordHasher::keyFromHex("abcd"), ConfigError);
    REQUIRE_THROWS_AS(WordHasher::keyFromHex(std::string(64, 'g')), ConfigError);
    REQUIRE_NOTHROW(WordHasher::keyFromHex(std::string(64, 'A')));
    REQUIRE_FALSE(WordHasher::isHashHex(std::string(63, 'a')));
}

TEST_CASE("password-context events are not admitted", "[privacy]") {
    PrivacyFilter filter(makeHasher(), nullptr, false);
    REQUIRE(filter.admits(tc::test::press(30, 0)));
    REQUIRE_FALSE(filter.admits(tc::test::press(30, 0, true)));
}

TEST_CASE("ignored words never yield a key and lose their text", "[privacy]") {
    auto hasher = makeHasher();
    auto ignored = std::make_shared<IgnoredWordSet>();
    ignored->addWord("hunter", *hasher);
    REQUIRE(ignored->size() == 1);
    REQUIRE(ignored->contains(hasher->hash("hunter")));

    PrivacyFilter filter(hasher, ignored, false);

    WordObservation obs;
    obs.text = "Hunter";
    obs.layout = "us";
    REQUIRE_FALSE(filter.admitWord(obs).has_value());
    REQUIRE(obs.text.empty());

    WordObservation normal;
    normal.text = "house";
    auto key = filter.admitWord(normal);
    REQUIRE(key);
    REQUIRE(*key == "house");
    REQUIRE(normal.text.empty());
}

TEST_CASE("hash storage keys words by hash", "[privacy]") {
    auto hasher = makeHasher();
    PrivacyFilter filter(hasher, std::make_shared<IgnoredWordSet>(), true);
    WordObservation obs;
    obs.text = "house";
    auto key = filter.admitWord(obs);
    REQUIRE(key);
    REQUIRE(*key == hasher->hash("house"));
    REQUIRE(filter.keyHash(*key) == *key);
    REQUIRE(obs.text.empty());
}

TEST_CASE("recently ignored hashes are reported once", "[privacy]") {
    auto hasher = makeHasher();
    IgnoredWordSet set;
    REQUIRE(set.addHash(hasher->hash("alpha")));
    REQUIRE_FALSE(set.addHash("not-a-hash"));
    set.addWord("beta", *hasher);
    set.addWord("alpha", *hasher);

    auto recent = set.takeRecentlyAdded();
    REQUIRE(recent.size() == 2);
    REQUIRE(set.takeRecentlyAdded().empty());
}

TEST_CASE("ignored hash file skips comments and rejects junk", "[privacy][config]") {
    const std::string path = "typing_coach_ignored_test.txt";
    auto hasher = makeHasher();
    {
        std::ofstream out(path);
        out << "# ignored words\n\n" << hasher->hash("one") << "\n  " << hasher->hash("two") << "  \n";
    }
    auto hashes = readIgnoredHashFile(path);
    REQUIRE(hashes.size() == 2);
    REQUIRE(hashes[0] == hasher->hash("one"));

    {
        std::ofstream out(path);
        out << "plaintext\n";
    }
    REQUIRE_THROWS_AS(readIgnoredHashFile(path), ConfigError);
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(IgnoredWordSet(std::vector<std::string>{"zz"}), ConfigError);
}
