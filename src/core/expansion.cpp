#include "hatch/expansion.hpp"

#include <algorithm>

namespace hatch {

const std::vector<std::string>& known_constants() {
    static const std::vector<std::string> names = {"app", "appid", "appname", "version"};
    return names;
}

ExpansionResult expand_constants(const std::string& input, const ConstantMap& constants) {
    ExpansionResult result;

    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        char c = input[i];
        if (c != '{') {
            output += c;
            ++i;
            continue;
        }

        // "{{" escapes a literal brace
        if (i + 1 < input.size() && input[i + 1] == '{') {
            output += '{';
            i += 2;
            continue;
        }

        size_t close = input.find('}', i + 1);
        if (close == std::string::npos) {
            // No closing brace, copy literally
            output += input.substr(i);
            break;
        }

        std::string name = input.substr(i + 1, close - i - 1);
        auto it = constants.find(name);
        if (it != constants.end()) {
            output += it->second;
        } else {
            result.ok = false;
            if (std::find(result.unknown.begin(), result.unknown.end(), name) == result.unknown.end()) {
                result.unknown.push_back(name);
            }
            output += input.substr(i, close - i + 1);
        }
        i = close + 1;

        if (output.size() > MAX_EXPANDED_SIZE) {
            result.ok = false;
            result.error = "expansion_overflow";
            result.value.clear();
            return result;
        }
    }

    if (!result.unknown.empty()) {
        result.error = "unknown constant {" + result.unknown.front() + "}";
    }
    result.value = std::move(output);
    return result;
}

std::vector<std::string> find_unknown_constants(const std::string& input) {
    ConstantMap blanks;
    for (const auto& name : known_constants()) {
        blanks[name] = "";
    }
    return expand_constants(input, blanks).unknown;
}

ConstantMap make_constants(const std::string& install_dir,
                           const std::string& app_id,
                           const std::string& app_name,
                           const std::string& version) {
    return {
        {"app", install_dir},
        {"appid", app_id},
        {"appname", app_name},
        {"version", version},
    };
}

} // namespace hatch
