#include <segmd/propagation/config.hpp>

#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

namespace segmd::propagation {

namespace {

// Gets an attribute by key; null and missing are both absent.
std::optional<Json::Value> find_attribute(const Json::Value& root, const char* key) {
    if (!root.isMember(key) || root[key].isNull()) {
        return std::nullopt;
    }
    return root[key];
}

std::optional<std::uint64_t> find_count(const Json::Value& root, const char* key) {
    const auto value = find_attribute(root, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->isUInt64()) {
        throw std::invalid_argument{std::string{"attribute `"} + key + "` must be a non-negative integer"};
    }
    return value->asUInt64();
}

}  // namespace

conditional_propagator::options options_from_json(const Json::Value& root) {
    if (!root.isObject()) {
        throw std::invalid_argument{"propagation options must be a JSON object"};
    }

    const auto walltime = find_attribute(root, "walltime_per_part");
    if (!walltime) {
        throw std::invalid_argument{"missing required attribute `walltime_per_part`"};
    }
    if (!walltime->isNumeric()) {
        throw std::invalid_argument{"attribute `walltime_per_part` must be a number (hours)"};
    }
    if (!(walltime->asDouble() > 0.0)) {
        throw std::invalid_argument{"attribute `walltime_per_part` must be positive"};
    }

    return {
        .walltime_per_part = md_engine::hours{walltime->asDouble()},
        .max_steps = find_count(root, "max_steps"),
        .max_frames = find_count(root, "max_frames"),
    };
}

conditional_propagator::options read_options(std::istream& in) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw std::invalid_argument{"could not parse propagation options: " + errors};
    }
    return options_from_json(root);
}

md_config md_config_from_json(const Json::Value& root) {
    if (!root.isObject()) {
        throw std::invalid_argument{"engine configuration must be a JSON object"};
    }

    md_config config;
    for (const auto& key : root.getMemberNames()) {
        const auto& value = root[key];
        if (value.isString()) {
            config.set(key, value.asString());
        } else if (value.isBool()) {
            config.set(key, value.asBool() ? "yes" : "no");
        } else if (value.isInt64()) {
            config.set(key, std::to_string(value.asInt64()));
        } else if (value.isUInt64()) {
            config.set(key, std::to_string(value.asUInt64()));
        } else if (value.isDouble()) {
            config.set(key, value.asString());
        } else {
            throw std::invalid_argument{"engine option `" + key + "` must be a string, number or boolean"};
        }
    }
    return config;
}

}  // namespace segmd::propagation
