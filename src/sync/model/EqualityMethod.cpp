#include "sync/model/EqualityMethod.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace sw::sync::model {

EqualityMethod parseEqualityMethods(const std::vector<std::string>& tokens) {
    auto set = EqualityMethod::None;
    for (auto token : tokens) {
        std::ranges::transform(token, token.begin(), [](const unsigned char c) { return std::tolower(c); });
        std::erase_if(token, [](const unsigned char c) { return std::isspace(c); });

        if (token.empty()) continue;
        if (token == "length" || token == "size") set |= EqualityMethod::Length;
        else if (token == "mtime" || token == "lastwritetime") set |= EqualityMethod::LastWriteTime;
        else if (token == "digest" || token == "content" || token == "hash") set |= EqualityMethod::ContentHash;
        else if (token == "none" || token == "always") set |= EqualityMethod::Always;
        else throw std::invalid_argument("Unknown equality method: " + token);
    }
    return set;
}

std::string to_string(const EqualityMethod methods) {
    static constexpr std::pair<EqualityMethod, const char*> names[] = {
        {EqualityMethod::Length, "Length"},
        {EqualityMethod::LastWriteTime, "LastWriteTime"},
        {EqualityMethod::ContentHash, "ContentHash"},
        {EqualityMethod::Always, "Always"},
    };

    std::string out;
    for (const auto& [flag, name] : names) {
        if (!hasFlag(methods, flag)) continue;
        if (!out.empty()) out += '|';
        out += name;
    }
    return out.empty() ? "None" : out;
}

}
