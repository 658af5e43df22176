#include "feature_resolver.hpp"

#include <cstdlib>

namespace hwenergy {
namespace features {

namespace {

// Minimum firmware for a gated capability, nullptr if the model never has it
struct ProductRule {
    const char *product_type;
    bool has_state;
    bool has_system;
    const char *identify_since;
    const char *decryption_since;
};

const ProductRule kProductRules[] = {
    {kModelP1Meter, false, true, "4.19", "4.19"},
    {kModelEnergySocket, true, true, "3.00", nullptr},
    {kModelWaterMeter, false, true, "2.03", nullptr},
    {kModelKwh1, false, true, nullptr, nullptr},
    {kModelKwh3, false, true, nullptr, nullptr},
    {kModelSdm230, false, true, nullptr, nullptr},
    {kModelSdm630, false, true, nullptr, nullptr},
};

bool gated(const char *since, const std::optional<std::string> &firmware) {
    return since != nullptr && firmware_at_least(firmware, since);
}

}  // namespace

std::optional<std::vector<unsigned long>> parse_version(const std::string &version) {
    std::vector<unsigned long> components;
    size_t start = 0;
    while (true) {
        size_t dot = version.find('.', start);
        std::string part = version.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (part.empty() || part.size() > 9) {
            return std::nullopt;
        }
        for (char c : part) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
        }
        components.push_back(std::strtoul(part.c_str(), nullptr, 10));

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return components;
}

int compare_versions(const std::vector<unsigned long> &a, const std::vector<unsigned long> &b) {
    size_t n = a.size() > b.size() ? a.size() : b.size();
    for (size_t i = 0; i < n; ++i) {
        unsigned long lhs = i < a.size() ? a[i] : 0;
        unsigned long rhs = i < b.size() ? b[i] : 0;
        if (lhs != rhs) {
            return lhs < rhs ? -1 : 1;
        }
    }
    return 0;
}

bool firmware_at_least(const std::optional<std::string> &firmware, const char *minimum) {
    if (!firmware) {
        return false;
    }
    auto actual = parse_version(*firmware);
    auto required = parse_version(minimum);
    if (!actual || !required) {
        return false;
    }
    return compare_versions(*actual, *required) >= 0;
}

FeatureSet resolve(const std::optional<std::string> &product_type, const std::optional<std::string> &firmware_version) {
    FeatureSet features;
    if (!product_type) {
        return features;
    }

    for (const auto &rule : kProductRules) {
        if (*product_type != rule.product_type) {
            continue;
        }
        features.has_state = rule.has_state;
        features.has_system = rule.has_system;
        features.has_identify = gated(rule.identify_since, firmware_version);
        features.has_decryption = gated(rule.decryption_since, firmware_version);
        break;
    }

    return features;
}

}  // namespace features
}  // namespace hwenergy
