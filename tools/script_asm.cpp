// Copyright (c) 2024-2026 The ScriptAsm Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// Command-line front end: assembles script ASM into hex, or disassembles
// hex back into ASM.

#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "core/logging.h"
#include "script/asm.h"
#include "script/script.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

namespace {

void print_usage() {
    std::cout << "ScriptAsm v1.0\n\n"
              << "Usage: scriptasm [options] [ASM words...]\n\n"
              << "Options:\n"
              << "  -asm=TEXT          Assemble TEXT\n"
              << "  -file=PATH         Assemble the contents of PATH ('-' for stdin)\n"
              << "  -disasm=HEX        Print the ASM form of a hex script\n"
              << "  -p2sh              Also print P2SH and P2WSH outputs\n"
              << "  -conf=PATH         Read options from an INI-style file\n"
              << "  -loglevel=LEVEL    trace|debug|info|warn|error|off\n"
              << "  -logfile=PATH      Append log output to PATH\n\n"
              << "Words starting with '-' (negative numbers) must follow '--'.\n\n"
              << "Examples:\n"
              << "  scriptasm OP_DUP OP_HASH160 <62e907b15cbf27d5425399ebf6f0fb50ebb88f18> OP_EQUALVERIFY OP_CHECKSIG\n"
              << "  scriptasm -disasm=76a91462e907b15cbf27d5425399ebf6f0fb50ebb88f1888ac\n";
}

core::Result<void> init_logging(const core::Config& config) {
    auto& logger = core::Logger::instance();

    auto level_name = config.get_or(core::CONF_LOGLEVEL, "warn");
    auto level = core::parse_log_level(level_name);
    if (!level) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "unknown log level '" + level_name + "'");
    }
    logger.set_level(*level);

    if (auto path = config.get(core::CONF_LOGFILE)) {
        if (!logger.set_log_file(*path)) {
            return core::make_error(core::ErrorCode::IO_ERROR,
                                    "unable to open log file '" + *path + "'");
        }
    }
    return core::make_ok();
}

core::Result<std::string> read_source(const core::Config& config) {
    if (auto text = config.get(core::CONF_ASM)) {
        return *text;
    }

    if (auto path = config.get(core::CONF_FILE)) {
        if (*path == "-") {
            return std::string(std::istreambuf_iterator<char>(std::cin),
                               std::istreambuf_iterator<char>());
        }
        std::ifstream ifs(*path);
        if (!ifs.is_open()) {
            return core::make_error(core::ErrorCode::IO_ERROR,
                                    "unable to open '" + *path + "'");
        }
        std::ostringstream oss;
        oss << ifs.rdbuf();
        return oss.str();
    }

    // Positional arguments form a single line of ASM.
    std::string joined;
    for (const auto& word : config.positionals()) {
        if (!joined.empty()) joined += ' ';
        joined += word;
    }
    if (joined.empty()) {
        return core::make_error(core::ErrorCode::CONFIG_MISSING,
                                "no ASM given");
    }
    return joined;
}

core::Result<void> run_disassemble(const std::string& hex) {
    auto bytes = core::from_hex(hex);
    if (!bytes) {
        return core::make_error(core::ErrorCode::PARSE_BAD_HEX,
                                "'" + hex + "' is not valid hex");
    }
    auto text = script::to_asm(script::Script(std::move(*bytes)));
    if (!text) {
        return core::make_error(core::ErrorCode::SCRIPT_TRUNCATED,
                                "push runs past the end of the script");
    }
    std::cout << *text << "\n";
    return core::make_ok();
}

core::Result<void> run_assemble(const core::Config& config) {
    SCRIPTASM_TRY_ASSIGN(source, read_source(config));

    auto parsed = script::parse_asm(source);
    if (!parsed) {
        return core::make_error(core::ErrorCode::PARSE_BAD_ASM,
                                parsed.error().to_string());
    }
    const auto& assembled = parsed.value();
    LOG_INFO(core::LogCategory::TOOL,
             "assembled " + std::to_string(assembled.size()) + " bytes");

    std::cout << core::to_hex(assembled.data()) << "\n";
    if (config.get_bool(core::CONF_P2SH)) {
        auto p2sh = script::Script::p2sh(assembled);
        auto p2wsh = script::Script::p2wsh(assembled);
        std::cout << "p2sh:  " << core::to_hex(p2sh.data()) << "\n"
                  << "p2wsh: " << core::to_hex(p2wsh.data()) << "\n";
    }
    return core::make_ok();
}

core::Result<void> run(int argc, char* argv[]) {
    core::Config config;
    SCRIPTASM_TRY_VOID(config.parse_args(argc, argv));
    if (auto conf = config.get(core::CONF_CONF)) {
        SCRIPTASM_TRY_VOID(config.parse_file(*conf));
    }
    SCRIPTASM_TRY_VOID(init_logging(config));

    if (auto hex = config.get(core::CONF_DISASM)) {
        return run_disassemble(*hex);
    }
    return run_assemble(config);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    auto result = run(argc, argv);
    if (!result) {
        LOG_DEBUG(core::LogCategory::TOOL, result.error().format());
        std::cerr << "error: " << result.error().message() << "\n";
        return 1;
    }
    return 0;
}
