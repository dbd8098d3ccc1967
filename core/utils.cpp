#include <cctype>
#include <stdexcept>

#include "utils.hpp"

std::optional<Provenance> parseProvenance(const std::string& text) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        if (std::isspace((unsigned char)c)) continue;  // tolerate " OBSERVED" from csv
        upper.push_back((char)std::toupper((unsigned char)c));
    }

    if (upper == "OBSERVED")  return Provenance::Observed;
    if (upper == "INFERRED")  return Provenance::Inferred;
    if (upper == "SIMULATED") return Provenance::Simulated;

    // numeric codes, single digit only
    if (upper.size() == 1 && upper[0] >= '0' && upper[0] <= '9') {
        return provenanceFromCode(upper[0] - '0');
    }
    return std::nullopt;
}

// true if everything after pos is whitespace (windows '\r' included)
static bool onlyBlanksAfter(const std::string& text, size_t pos) {
    for (size_t i = pos; i < text.size(); ++i) {
        if (!std::isspace((unsigned char)text[i])) return false;
    }
    return true;
}

std::optional<int> parseIntToken(const std::string& text) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (!onlyBlanksAfter(text, used)) return std::nullopt;
    return value;
}

std::optional<double> parseDoubleToken(const std::string& text) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (!onlyBlanksAfter(text, used)) return std::nullopt;
    return value;
}

std::optional<size_t> parseSizeToken(const std::string& text) {
    // stoull takes "-1" and wraps it
    for (char c : text) {
        if (c == '-') return std::nullopt;
    }
    size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (!onlyBlanksAfter(text, used)) return std::nullopt;
    return (size_t)value;
}
