// =============================================================================
// config.cpp - JSON Settings Loader
// =============================================================================

#include "perpcore/config.hpp"
#include "perpcore/errors.hpp"
#include "perpcore/fixed_point.hpp"
#include "perpcore/logging.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace perpcore {

using json = nlohmann::json;

namespace {

Address read_address(const json& obj, const char* key) {
    const auto& value = obj.at(key);
    if (!value.is_string()) {
        throw ParamError(std::string("market.") + key + " must be a hex string");
    }
    return addresses::from_hex(value.get<std::string>());
}

I128 read_param(RiskParameter param, const json& value) {
    const std::string name = parameter_name(param);

    if (value.is_number_integer()) {
        I128 raw = value.is_number_unsigned() ? static_cast<I128>(value.get<uint64_t>())
                                              : static_cast<I128>(value.get<int64_t>());
        return is_seconds(param) ? raw : raw * X18_ONE;
    }
    if (value.is_string()) {
        if (is_seconds(param)) {
            throw ParamError(name + " is in seconds and must be an integer");
        }
        return x18::parse(value.get<std::string>());
    }
    throw ParamError(name + " must be an integer or a decimal string");
}

} // anonymous namespace

Settings Settings::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ParamError("cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_text(buffer.str());
}

Settings Settings::from_json_text(std::string_view content) {
    json root = json::parse(content.begin(), content.end(), nullptr, false);
    if (root.is_discarded()) {
        throw ParamError("config is not valid JSON");
    }
    return from_json(root);
}

Settings Settings::from_json(const json& root) {
    if (!root.is_object()) {
        throw ParamError("config root must be an object");
    }

    Settings settings;

    if (root.contains("log_level")) {
        const auto& level = root.at("log_level");
        if (!level.is_string()) {
            throw ParamError("log_level must be a string");
        }
        settings.log_level = level.get<std::string>();
    }

    if (root.contains("market")) {
        const auto& market = root.at("market");
        if (!market.is_object()) {
            throw ParamError("market must be an object");
        }
        if (market.contains("address")) {
            settings.market.address = read_address(market, "address");
        }
        if (market.contains("fee_recipient")) {
            settings.market.fee_recipient = read_address(market, "fee_recipient");
        }
    }

    if (root.contains("risk")) {
        const auto& risk = root.at("risk");
        if (!risk.is_object()) {
            throw ParamError("risk must be an object");
        }
        for (const auto& [key, value] : risk.items()) {
            auto param = parameter_from_name(key);
            if (!param) {
                throw ParamError("unknown risk parameter: " + key);
            }
            settings.risk.set(*param, read_param(*param, value));
        }
    }

    return settings;
}

void Settings::apply_logging() const {
    logging::set_level(log_level);
}

} // namespace perpcore
