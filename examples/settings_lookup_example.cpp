/**
 * @file settings_lookup_example.cpp
 * @brief Resolves service settings from layered sources with Maybe
 */

#include "nullsafe/core/maybe.hpp"
#include "nullsafe/core/error_suppliers.hpp"
#include "nullsafe/core/failures.hpp"

#include <iostream>
#include <map>
#include <string>

using namespace nullsafe;

using Settings = std::map<std::string, std::string>;

Maybe<std::string> Lookup(const Settings& source, const std::string& key) {
    const auto it = source.find(key);
    if (it == source.end()) {
        return Maybe<std::string>::Unknown();
    }
    return Maybe<std::string>::Definitely(it->second);
}

Maybe<std::string> Resolve(const std::string& key,
                           const Settings& overrides,
                           const Settings& environment,
                           const Settings& defaults) {
    return Lookup(overrides, key)
        .Otherwise(Lookup(environment, key))
        .Otherwise(Lookup(defaults, key));
}

int main() {
    std::cout << "=== nullsafe - Settings Lookup Example ===" << std::endl;
    std::cout << std::endl;

    const Settings overrides = {{"log_level", "debug"}};
    const Settings environment = {{"host", "db.internal"}, {"log_level", "info"}};
    const Settings defaults = {{"host", "localhost"}, {"port", "5432"}};

    std::cout << "1. Resolving layered settings..." << std::endl;
    for (const auto* key : {"host", "port", "log_level", "user"}) {
        std::cout << "   " << key << ": " << Resolve(key, overrides, environment, defaults) << std::endl;
    }
    std::cout << std::endl;

    std::cout << "2. Transforming and substituting defaults..." << std::endl;
    const auto port = Resolve("port", overrides, environment, defaults)
        .Map([](const std::string& text) { return std::stoi(text); })
        .Otherwise(5432);
    const auto timeout = Resolve("timeout_ms", overrides, environment, defaults)
        .Map([](const std::string& text) { return std::stoi(text); })
        .Otherwise(30000);
    std::cout << "   port: " << port << std::endl;
    std::cout << "   timeout_ms: " << timeout << std::endl;
    std::cout << std::endl;

    std::cout << "3. Querying without losing absence..." << std::endl;
    const auto verbose = Resolve("log_level", overrides, environment, defaults)
        .Query([](const std::string& level) { return level == "debug"; });
    std::cout << "   verbose: " << verbose.ToString(configuration::DisplayConfig::Terse()) << std::endl;
    std::cout << std::endl;

    std::cout << "4. Failing fast on a required setting..." << std::endl;
    try {
        const auto user = Resolve("user", overrides, environment, defaults)
            .OtherwiseThrow(ErrorSuppliers::IllegalArgument("missing required setting 'user'"));
        std::cout << "   user: " << user << std::endl;
    } catch (const IllegalArgumentError& ex) {
        std::cout << "   ✗ " << ex.what() << std::endl;
    }
    std::cout << std::endl;

    std::cout << "5. Reporting absence as a value..." << std::endl;
    const auto host = Resolve("host", overrides, environment, defaults)
        .OtherwiseErr(ErrorSuppliers::IllegalArgument("missing required setting 'host'"));
    if (host.IsErr()) {
        std::cerr << "   ✗ " << host.UnwrapErr().what() << std::endl;
        return 1;
    }
    std::cout << "   ✓ host: " << host.Unwrap() << std::endl;

    return 0;
}
