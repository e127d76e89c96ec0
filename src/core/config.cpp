#include "core/config.h"
#include "core/logging.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>

namespace core {

namespace {

bool is_blank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && is_blank(sv.front())) sv.remove_prefix(1);
    while (!sv.empty() && is_blank(sv.back())) sv.remove_suffix(1);
    return sv;
}

std::string lowercase(std::string_view sv) {
    std::string out(sv);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/// Split "key=value" (or bare "key") into trimmed parts.
std::pair<std::string_view, std::string_view> split_assignment(
        std::string_view text) {
    auto eq = text.find('=');
    if (eq == std::string_view::npos) {
        return {trim(text), "1"};
    }
    return {trim(text.substr(0, eq)), trim(text.substr(eq + 1))};
}

} // anonymous namespace

Result<void> Config::parse_args(int argc, const char* const argv[]) {
    auto& values = layers_[COMMAND_LINE];
    bool only_positionals = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.empty()) continue;

        if (only_positionals || arg == "-" || arg.front() != '-') {
            positionals_.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positionals = true;
            continue;
        }

        arg.remove_prefix(arg.starts_with("--") ? 2 : 1);
        auto [key, value] = split_assignment(arg);
        if (key.empty()) {
            return make_error(ErrorCode::CONFIG_ERROR,
                              "option without a name: '" +
                              std::string(argv[i]) + "'");
        }
        values.insert_or_assign(std::string(key), std::string(value));
    }
    return make_ok();
}

Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return make_error(ErrorCode::CONFIG_MISSING,
                          "cannot open config file '" + path.string() + "'");
    }
    LOG_INFO(LogCategory::TOOL, "reading config file '" + path.string() + "'");

    auto& values = layers_[CONFIG_FILE];
    std::string line;
    for (size_t line_no = 1; std::getline(in, line); ++line_no) {
        std::string_view text = trim(line);
        if (text.empty() || text.front() == '#') continue;

        auto [key, value] = split_assignment(text);
        if (key.empty()) {
            return make_error(ErrorCode::CONFIG_ERROR,
                              path.string() + ":" + std::to_string(line_no) +
                              ": line has no key");
        }
        values.insert_or_assign(std::string(key), std::string(value));
    }
    return make_ok();
}

void Config::set(std::string_view key, std::string value) {
    layers_[FALLBACK].insert_or_assign(std::string(key), std::move(value));
}

const std::string* Config::find(std::string_view key) const {
    for (const auto& values : layers_) {
        if (auto it = values.find(key); it != values.end()) {
            return &it->second;
        }
    }
    return nullptr;
}

std::optional<std::string> Config::get(std::string_view key) const {
    if (const auto* v = find(key)) return *v;
    return std::nullopt;
}

std::string Config::get_or(std::string_view key,
                           std::string_view fallback) const {
    if (const auto* v = find(key)) return *v;
    return std::string(fallback);
}

bool Config::get_bool(std::string_view key, bool fallback) const {
    const auto* v = find(key);
    if (!v) return fallback;

    const auto word = lowercase(*v);
    if (word == "1" || word == "true" || word == "yes" || word == "on") {
        return true;
    }
    if (word == "0" || word == "false" || word == "no" || word == "off") {
        return false;
    }
    return fallback;
}

} // namespace core
