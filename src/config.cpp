// VaultUSD - Configuration Implementation

#include "vusd/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace vusd {

using json = nlohmann::json;

namespace {

uint8_t read_decimals(const json& j, const char* key, uint8_t fallback) {
    if (!j.contains(key)) return fallback;
    const json& value = j.at(key);
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::string("Config: ") + key + " must be an integer");
    }
    // Checked in the widest type first; narrower gets would wrap
    bool in_range = value.is_number_unsigned() ? value.get<uint64_t>() <= 255
                                               : value.get<int64_t>() >= 0 &&
                                                     value.get<int64_t>() <= 255;
    if (!in_range) {
        throw std::runtime_error(std::string("Config: ") + key + " out of range");
    }
    return static_cast<uint8_t>(value.get<uint64_t>());
}

// Answers may exceed 64 bits, so decimal strings are accepted as well
I128 read_answer(const json& j) {
    if (j.is_number_unsigned()) {
        return static_cast<I128>(j.get<uint64_t>());
    }
    if (j.is_number_integer()) {
        return static_cast<I128>(j.get<int64_t>());
    }
    if (!j.is_string()) {
        throw std::runtime_error("Config: price_feed.answer must be an integer or string");
    }

    std::string text = j.get<std::string>();
    std::string_view digits{text};
    bool negative = !digits.empty() && digits[0] == '-';
    if (negative) digits.remove_prefix(1);
    auto magnitude = U256::from_string(digits);
    constexpr U128 I128_MAX = ~U128(0) >> 1;
    if (!magnitude || magnitude->hi() != 0 || magnitude->lo() > I128_MAX) {
        throw std::runtime_error("Config: invalid price_feed.answer '" + text + "'");
    }
    I128 value = static_cast<I128>(magnitude->lo());
    return negative ? -value : value;
}

} // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    try {
        json root = json::parse(content);
        if (!root.is_object()) {
            throw std::runtime_error("Config: top level must be an object");
        }

        if (root.contains("ledger_address")) {
            std::string hex = root.at("ledger_address").get<std::string>();
            auto addr = addresses::from_hex(hex);
            if (!addr) {
                throw std::runtime_error("Config: invalid ledger_address '" + hex + "'");
            }
            config.ledger_address = *addr;
        }

        if (root.contains("collateral_symbol")) {
            config.collateral_symbol = root.at("collateral_symbol").get<std::string>();
        }

        if (root.contains("log_level")) {
            std::string name = root.at("log_level").get<std::string>();
            auto level = Logger::parse_level(name);
            if (!level) {
                throw std::runtime_error("Config: unknown log_level '" + name + "'");
            }
            config.log_level = *level;
        }

        if (root.contains("liability_token")) {
            const json& token = root.at("liability_token");
            if (token.contains("name")) config.liability_token.name = token.at("name").get<std::string>();
            if (token.contains("symbol")) config.liability_token.symbol = token.at("symbol").get<std::string>();
            config.liability_token.decimals =
                read_decimals(token, "decimals", config.liability_token.decimals);
        }

        if (root.contains("price_feed")) {
            const json& feed = root.at("price_feed");
            if (feed.contains("answer")) config.price_feed.answer = read_answer(feed.at("answer"));
            config.price_feed.decimals = read_decimals(feed, "decimals", config.price_feed.decimals);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Config: malformed JSON: ") + e.what());
    }

    return config;
}

} // namespace vusd
