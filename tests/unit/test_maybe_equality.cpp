#include <catch2/catch_test_macros.hpp>
#include "nullsafe/core/maybe.hpp"
#include "nullsafe/core/constants.hpp"
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>

using namespace nullsafe;
using nullsafe::configuration::DisplayConfig;

TEST_CASE("Maybe<T> - Equality", "[maybe][equality]") {
    SECTION("Known values compare by element equality") {
        REQUIRE(Maybe<int>::Definitely(1) == Maybe<int>::Definitely(1));
        REQUIRE_FALSE(Maybe<int>::Definitely(1) == Maybe<int>::Definitely(2));
        REQUIRE(Maybe<int>::Definitely(1) != Maybe<int>::Definitely(2));
    }

    SECTION("Unknown equals every other Unknown of the same type") {
        const auto first = Maybe<int>::Unknown();
        const auto second = Maybe<int>::Nothing();
        REQUIRE(first == first);
        REQUIRE(first == second);
        REQUIRE(second == first);
    }

    SECTION("Unknown never equals a Known value") {
        const auto unknown = Maybe<int>::Unknown();
        const auto known = Maybe<int>::Definitely(0);
        REQUIRE(unknown != known);
        REQUIRE(known != unknown);
    }

    SECTION("A present empty string is not Unknown") {
        REQUIRE(Maybe<std::string>::Definitely("") != Maybe<std::string>::Unknown());
    }

    SECTION("Copies compare equal to their source") {
        const auto original = Maybe<std::string>::Definitely("copy");
        const auto copy = original;
        REQUIRE(copy == original);
    }
}

TEST_CASE("Maybe<T> - Hashing", "[maybe][equality]") {
    const std::hash<Maybe<std::string>> hasher{};

    SECTION("Unknown hashes to the fixed constant") {
        REQUIRE(hasher(Maybe<std::string>::Unknown()) == MaybeConstants::UNKNOWN_HASH);
    }

    SECTION("Known hashes like its value") {
        REQUIRE(hasher(Maybe<std::string>::Definitely("key")) == std::hash<std::string>{}("key"));
    }

    SECTION("Equal instances hash equally") {
        REQUIRE(hasher(Maybe<std::string>::Definitely("a")) == hasher(Maybe<std::string>::Definitely("a")));
        REQUIRE(hasher(Maybe<std::string>::Unknown()) == hasher(Maybe<std::string>::Nothing()));
    }

    SECTION("Usable as a key in hashed containers") {
        std::unordered_set<Maybe<int>> seen;
        seen.insert(Maybe<int>::Definitely(1));
        seen.insert(Maybe<int>::Definitely(1));
        seen.insert(Maybe<int>::Unknown());
        seen.insert(Maybe<int>::Nothing());
        REQUIRE(seen.size() == 2);
        REQUIRE(seen.contains(Maybe<int>::Unknown()));

        std::unordered_map<Maybe<std::string>, int> counts;
        ++counts[Maybe<std::string>::Definitely("x")];
        ++counts[Maybe<std::string>::Definitely("x")];
        ++counts[Maybe<std::string>::Unknown()];
        REQUIRE(counts.at(Maybe<std::string>::Definitely("x")) == 2);
        REQUIRE(counts.at(Maybe<std::string>::Unknown()) == 1);
    }
}

TEST_CASE("Maybe<T> - Rendering", "[maybe][display]") {
    SECTION("Default rendering matches the descriptive style") {
        REQUIRE(Maybe<int>::Definitely(5).ToString() == "definitely 5");
        REQUIRE(Maybe<int>::Unknown().ToString() == "unknown");
    }

    SECTION("Terse rendering") {
        const auto terse = DisplayConfig::Terse();
        REQUIRE(Maybe<int>::Definitely(5).ToString(terse) == "some(5)");
        REQUIRE(Maybe<int>::Unknown().ToString(terse) == "none");
    }

    SECTION("fmt formatter uses the default style") {
        REQUIRE(fmt::format("{}", Maybe<std::string>::Definitely("x")) == "definitely x");
        REQUIRE(fmt::format("[{}]", Maybe<std::string>::Unknown()) == "[unknown]");
    }

    SECTION("Stream insertion uses the default style") {
        std::ostringstream out;
        out << Maybe<int>::Definitely(3) << ' ' << Maybe<int>::Unknown();
        REQUIRE(out.str() == "definitely 3 unknown");
    }
}
