#include <catch2/catch.hpp>

#include <linux/input-event-codes.h>

#include "typing_coach/memory_gateway.hpp"

using namespace tc::core;

TEST_CASE("append burst is idempotent on start time", "[gateway]") {
    MemoryGateway gateway;
    Burst burst;
    burst.start_time_ms = 1000;
    burst.end_time_ms = 7000;
    burst.key_count = 30;

    REQUIRE(gateway.appendBurst(burst));
    REQUIRE(gateway.appendBurst(burst));
    REQUIRE(gateway.bursts().size() == 1);
    REQUIRE(gateway.writeCount() == 1);

    Burst other = burst;
    other.start_time_ms = 9000;
    REQUIRE(gateway.appendBurst(other));
    REQUIRE(gateway.bursts().size() == 2);
}

TEST_CASE("upserts replace rows by identity", "[gateway]") {
    MemoryGateway gateway;
    KeyStat stat;
    stat.key_code = KEY_A;
    stat.layout = "us";
    stat.stat.add(100);
    stat.stat.add(200);
    REQUIRE(gateway.upsertKeyStat(stat));

    stat.stat.add(300);
    REQUIRE(gateway.upsertKeyStat(stat));
    REQUIRE(gateway.keyStatCount() == 1);
    REQUIRE(gateway.keyStat(KEY_A, "us")->stat.count == 3);
    REQUIRE_FALSE(gateway.keyStat(KEY_A, "de").has_value());

    DigraphStat digraph;
    digraph.first_key_code = KEY_T;
    digraph.second_key_code = KEY_H;
    digraph.layout = "us";
    REQUIRE(gateway.upsertDigraphStat(digraph));
    REQUIRE(gateway.digraphStat(KEY_T, KEY_H, "us").has_value());
    REQUIRE_FALSE(gateway.digraphStat(KEY_H, KEY_T, "us").has_value());

    WordStat word;
    word.word_key = "the";
    word.layout = "us";
    REQUIRE(gateway.upsertWordStat(word));
    REQUIRE(gateway.upsertWordStat(word));
    REQUIRE(gateway.wordStatCount() == 1);
}

TEST_CASE("injected failures reject writes without storing", "[gateway]") {
    MemoryGateway gateway;
    gateway.failNextWrites(1);
    Burst burst;
    burst.start_time_ms = 5;
    REQUIRE_FALSE(gateway.appendBurst(burst));
    REQUIRE(gateway.bursts().empty());
    REQUIRE(gateway.appendBurst(burst));
    REQUIRE(gateway.bursts().size() == 1);
}
