#include "test_common.hpp"

TEST_CASE("BoundedChannel delivers values in order") {
    BoundedChannel<int> ch(4);
    REQUIRE(ch.try_send(1));
    REQUIRE(ch.try_send(2));
    REQUIRE(ch.try_send(3));
    int v = 0;
    REQUIRE(ch.receive(v));
    REQUIRE(v == 1);
    REQUIRE(ch.try_receive() == 2);
    REQUIRE(ch.receive_for(std::chrono::milliseconds(10)) == 3);
    REQUIRE_FALSE(ch.try_receive().has_value());
}

TEST_CASE("BoundedChannel drops when full without blocking") {
    BoundedChannel<int> ch(2);
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 1000; ++i)
        ch.try_send(i);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed < std::chrono::seconds(1));
    REQUIRE(ch.size() == 2);
    REQUIRE(ch.dropped() == 998);
    REQUIRE(ch.try_receive() == 0);
    REQUIRE(ch.try_receive() == 1);
}

TEST_CASE("BoundedChannel close wakes receivers and keeps queued values") {
    BoundedChannel<std::string> ch(8);
    REQUIRE(ch.try_send("left"));
    ch.close();
    REQUIRE(ch.closed());
    REQUIRE_FALSE(ch.try_send("late"));
    std::string out;
    REQUIRE(ch.receive(out));
    REQUIRE(out == "left");
    REQUIRE_FALSE(ch.receive(out));
}

TEST_CASE("BoundedChannel receive blocks until a value arrives") {
    BoundedChannel<int> ch(1);
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ch.try_send(42);
    });
    int v = 0;
    REQUIRE(ch.receive(v));
    REQUIRE(v == 42);
    producer.join();
}

TEST_CASE("BoundedChannel receive_for times out on an empty channel") {
    BoundedChannel<int> ch(1);
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(ch.receive_for(std::chrono::milliseconds(30)).has_value());
    REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(25));
}
