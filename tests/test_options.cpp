#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "sipwire/options.hpp"

using json = nlohmann::json;

TEST_CASE("Listener options default to all interfaces and the maximum UDP payload", "[options]")
{
    const ListenerOptions options = parse_listener_options(json::object());
    CHECK(options.bind_address == "0.0.0.0");
    CHECK(options.poll_interval == std::chrono::milliseconds(100));
    CHECK(options.error_backoff == std::chrono::milliseconds(50));
    CHECK(options.buffer_size == 65535);
}

TEST_CASE("Listener options are read from JSON", "[options]")
{
    const ListenerOptions options = parse_listener_options(
        { { "bind_address", "127.0.0.1" }, { "poll_interval_ms", 20 }, { "error_backoff_ms", 1 }, { "buffer_size", 1500 } });
    CHECK(options.bind_address == "127.0.0.1");
    CHECK(options.poll_interval == std::chrono::milliseconds(20));
    CHECK(options.error_backoff == std::chrono::milliseconds(1));
    CHECK(options.buffer_size == 1500);

    const ListenerOptions reparsed = parse_listener_options(listener_options_to_json(options));
    CHECK(reparsed.bind_address == options.bind_address);
    CHECK(reparsed.poll_interval == options.poll_interval);
    CHECK(reparsed.buffer_size == options.buffer_size);
}

TEST_CASE("Invalid listener options are rejected", "[options]")
{
    CHECK_THROWS_AS(parse_listener_options({ { "poll_interval_ms", 0 } }), std::invalid_argument);
    CHECK_THROWS_AS(parse_listener_options({ { "error_backoff_ms", -1 } }), std::invalid_argument);
    CHECK_THROWS_AS(parse_listener_options({ { "error_backoff_ms", 0 } }), std::invalid_argument);
    CHECK_THROWS_AS(parse_listener_options({ { "buffer_size", -5 } }), std::invalid_argument);
    CHECK_THROWS_AS(parse_listener_options({ { "buffer_size", 0 } }), std::invalid_argument);
    CHECK_THROWS_AS(parse_listener_options({ { "buffer_size", 65536 } }), std::invalid_argument);
    CHECK_THROWS_AS(parse_listener_options({ { "bind_address", "not an address" } }), std::invalid_argument);
    CHECK_THROWS_AS(parse_listener_options(json::array()), std::invalid_argument);
    CHECK_THROWS_AS(parse_listener_options({ { "poll_interval_ms", "fast" } }), json::type_error);
}

TEST_CASE("Options built in code are checked the same way as parsed ones", "[options]")
{
    CHECK_NOTHROW(validate_listener_options(ListenerOptions {}));

    ListenerOptions options;
    SECTION("empty buffer")
    {
        options.buffer_size = 0;
    }
    SECTION("oversized buffer")
    {
        options.buffer_size = 65536;
    }
    SECTION("zero poll interval")
    {
        options.poll_interval = std::chrono::milliseconds(0);
    }
    SECTION("zero error back-off")
    {
        options.error_backoff = std::chrono::milliseconds(0);
    }
    SECTION("bad bind address")
    {
        options.bind_address = "localhost:5060";
    }
    CHECK_THROWS_AS(validate_listener_options(options), std::invalid_argument);
}

TEST_CASE("Listener options load from a file", "[options]")
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "sipwire_options_test.json";

    SECTION("missing file")
    {
        std::filesystem::remove(path);
        CHECK_FALSE(load_listener_options(path).has_value());
    }
    SECTION("valid file")
    {
        {
            std::ofstream out(path);
            out << R"({"poll_interval_ms": 25})";
        }
        const auto options = load_listener_options(path);
        REQUIRE(options.has_value());
        CHECK(options->poll_interval == std::chrono::milliseconds(25));
        CHECK(options->buffer_size == 65535);
    }
    SECTION("malformed file")
    {
        {
            std::ofstream out(path);
            out << "{ poll";
        }
        CHECK_FALSE(load_listener_options(path).has_value());
    }
    std::filesystem::remove(path);
}
