// perpcore - Settings Loader Tests

#include <catch2/catch_test_macros.hpp>
#include <perpcore/config.hpp>
#include <perpcore/errors.hpp>
#include <perpcore/fixed_point.hpp>
#include <perpcore/logging.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace perpcore;

TEST_CASE("Settings defaults", "[config]") {
    Settings settings = Settings::from_json_text("{}");

    REQUIRE(settings.log_level == "info");
    REQUIRE(settings.market.address == addresses::BURN);
    REQUIRE(settings.market.fee_recipient == addresses::BURN);

    RiskParams defaults;
    for (size_t i = 0; i < RISK_PARAMETER_COUNT; ++i) {
        RiskParameter param = *parameter_from_index(i);
        REQUIRE(settings.risk.get(param) == defaults.get(param));
    }
}

TEST_CASE("Settings from JSON text", "[config]") {
    Settings settings = Settings::from_json_text(R"({
        "log_level": "debug",
        "market": {
            "address": "0x0000000000000000000000000000000000009000",
            "fee_recipient": "00000000000000000000000000000000000090AB"
        },
        "risk": {
            "lmbda": "0.5",
            "cap_leverage": 10,
            "trading_fee_rate": "0.001",
            "circuit_breaker_window": 86400
        }
    })");

    REQUIRE(settings.log_level == "debug");
    REQUIRE(settings.market.address == addresses::from_u64(0x9000));
    REQUIRE(settings.market.fee_recipient == addresses::from_u64(0x90AB));

    REQUIRE(settings.risk.lmbda() == x18::parse("0.5"));
    REQUIRE(settings.risk.cap_leverage() == x18::from_int(10));
    REQUIRE(settings.risk.trading_fee_rate() == x18::parse("0.001"));
    REQUIRE(settings.risk.circuit_breaker_window() == 86400);

    // Untouched keys keep defaults
    REQUIRE(settings.risk.delta() == x18::parse("0.0025"));
}

TEST_CASE("Settings from a parsed document", "[config]") {
    nlohmann::json root = {
        {"risk", {{"k", 0}, {"average_block_time", 12}}}
    };
    Settings settings = Settings::from_json(root);
    REQUIRE(settings.risk.k() == 0);
    REQUIRE(settings.risk.average_block_time() == 12);
}

TEST_CASE("Settings rejects bad input", "[config]") {
    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(Settings::from_json_text("{\"risk\": "), ParamError);
        REQUIRE_THROWS_AS(Settings::from_json_text("[]"), ParamError);
    }

    SECTION("Unknown parameter") {
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"risk": {"lambda": "1"}})"), ParamError);
    }

    SECTION("Out of bounds") {
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"risk": {"cap_leverage": 50}})"), ParamError);
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"risk": {"delta": "0.5"}})"), ParamError);
    }

    SECTION("Wrong types") {
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"risk": {"delta": 0.0025}})"), ParamError);
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"risk": {"average_block_time": "14"}})"),
                          ParamError);
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"risk": []})"), ParamError);
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"market": {"address": 36864}})"), ParamError);
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"log_level": 3})"), ParamError);
    }

    SECTION("Bad decimals and addresses") {
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"risk": {"delta": "1e-3"}})"), ParamError);
        REQUIRE_THROWS_AS(Settings::from_json_text(R"({"market": {"address": "0x1234"}})"),
                          ParamError);
        REQUIRE_THROWS_AS(
            Settings::from_json_text(R"({"market": {"address": "0xzz00000000000000000000000000000000009000"}})"),
            ParamError);
    }
}

TEST_CASE("Settings from file", "[config]") {
    SECTION("Bundled example") {
        Settings settings = Settings::from_file(PERPCORE_SOURCE_DIR "/config/market.example.json");
        REQUIRE(settings.market.address == addresses::from_u64(0x9000));
        REQUIRE(settings.market.fee_recipient == addresses::from_u64(0x9001));
        REQUIRE(settings.risk.cap_notional() == x18::from_int(800000));
        REQUIRE(settings.risk.k() == RiskParams().k());
    }

    SECTION("Temporary file") {
        auto path = std::filesystem::temp_directory_path() / "perpcore_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"log_level": "warn", "risk": {"min_collateral": "1"}})";
        }
        Settings settings = Settings::from_file(path.string());
        std::filesystem::remove(path);

        REQUIRE(settings.log_level == "warn");
        REQUIRE(settings.risk.min_collateral() == X18_ONE);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(Settings::from_file("/nonexistent/perpcore.json"), ParamError);
    }
}

TEST_CASE("Log level from settings", "[config]") {
    Settings settings;
    settings.log_level = "warn";
    REQUIRE_NOTHROW(settings.apply_logging());

    settings.log_level = "off";
    REQUIRE_NOTHROW(settings.apply_logging());

    settings.log_level = "verbose";
    REQUIRE_THROWS_AS(settings.apply_logging(), ParamError);

    REQUIRE_NOTHROW(logging::set_level("info"));
}
