#pragma once

#include "core/error.h"

#include <array>
#include <functional>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Option names understood by the scriptasm tool.
inline constexpr const char* CONF_ASM      = "asm";       // ASM text
inline constexpr const char* CONF_FILE     = "file";      // ASM file, "-" = stdin
inline constexpr const char* CONF_CONF     = "conf";      // extra config file
inline constexpr const char* CONF_DISASM   = "disasm";    // hex to disassemble
inline constexpr const char* CONF_P2SH     = "p2sh";      // print wrapped outputs
inline constexpr const char* CONF_LOGLEVEL = "loglevel";
inline constexpr const char* CONF_LOGFILE  = "logfile";

// ---------------------------------------------------------------------------
// Config  --  options gathered from several sources
//
// A lookup consults the command line first, then any config file, then
// values installed with set(). Command-line words that are not options are
// collected in order as positionals.
// ---------------------------------------------------------------------------
class Config {
public:
    /// Read argv[1..argc). "-k=v" and "--k=v" set k to v; "-k" alone sets
    /// it to "1". "--" ends option parsing, and a lone "-" or any word not
    /// starting with '-' is a positional.
    [[nodiscard]] Result<void> parse_args(int argc, const char* const argv[]);

    /// Read "key=value" lines. Blank lines and lines starting with '#' are
    /// skipped; a bare "key" sets it to "1".
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    /// Install a fallback value, used only if no other source has the key.
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view fallback) const;

    /// 1/true/yes/on and 0/false/no/off, any case. Other spellings, and
    /// absent keys, give @p fallback.
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool fallback = false) const;

    [[nodiscard]] bool has(std::string_view key) const {
        return find(key) != nullptr;
    }

    [[nodiscard]] const std::vector<std::string>& positionals() const noexcept {
        return positionals_;
    }

private:
    enum Layer { COMMAND_LINE, CONFIG_FILE, FALLBACK, LAYER_COUNT };

    using Values = std::map<std::string, std::string, std::less<>>;

    const std::string* find(std::string_view key) const;

    std::array<Values, LAYER_COUNT> layers_;
    std::vector<std::string> positionals_;
};

} // namespace core
