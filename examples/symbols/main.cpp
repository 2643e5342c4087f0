//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/symbols/main.cpp
// Purpose: Launches a language server, opens one file and prints its document symbols
//==========================================================================================================

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "logging/Logger.h"
#include "lspc/Session.h"
#include "lspc/version.h"

namespace {

std::string languageIdFor(const std::filesystem::path& file) {
    static const std::unordered_map<std::string, std::string> byExtension = {
        {".c", "c"}, {".h", "c"}, {".cc", "cpp"}, {".cpp", "cpp"}, {".hpp", "cpp"},
        {".py", "python"}, {".rs", "rust"}, {".go", "go"}, {".ts", "typescript"},
        {".js", "javascript"}, {".java", "java"}, {".cs", "csharp"}};
    auto it = byExtension.find(file.extension().string());
    return it == byExtension.end() ? "plaintext" : it->second;
}

// Prints DocumentSymbol trees and flat SymbolInformation lists
void printSymbols(const lspc::JSONValue& symbols, int depth) {
    if (!symbols.isArray()) {
        return;
    }
    for (const auto& symbol : std::get<lspc::JSONValue::Array>(symbols.value)) {
        const std::string name = lspc::GetStringMember(*symbol, "name").value_or("?");
        const int64_t kind = lspc::GetIntMember(*symbol, "kind").value_or(0);
        const lspc::JSONValue* range = lspc::FindMember(*symbol, "selectionRange");
        if (range == nullptr) {
            if (const lspc::JSONValue* location = lspc::FindMember(*symbol, "location")) {
                range = lspc::FindMember(*location, "range");
            }
        }
        int64_t line = 0;
        if (range != nullptr) {
            if (const lspc::JSONValue* start = lspc::FindMember(*range, "start")) {
                line = lspc::GetIntMember(*start, "line").value_or(0);
            }
        }
        std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ') << name
                  << " (kind " << kind << ", line " << line + 1 << ")" << std::endl;
        if (const lspc::JSONValue* children = lspc::FindMember(*symbol, "children")) {
            printSymbols(*children, depth + 1);
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);

    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <file> <server-executable> [server-args...]" << std::endl;
        std::cerr << "lspc " << lspc::getVersionString() << std::endl;
        return 2;
    }

    std::error_code ec;
    const std::filesystem::path file = std::filesystem::absolute(argv[1], ec);
    std::ifstream in(file);
    if (ec || !in) {
        std::cerr << "cannot read " << argv[1] << std::endl;
        return 2;
    }
    std::stringstream text;
    text << in.rdbuf();

    lspc::ServerLaunchConfig launch;
    launch.executable = argv[2];
    for (int i = 3; i < argc; ++i) {
        launch.arguments.emplace_back(argv[i]);
    }
    lspc::InitializeOptions init;
    init.rootPath = std::filesystem::current_path().string();

    lspc::Session session;
    try {
        session.Start(launch, init);
        const std::string uri = lspc::FileUriFromPath(file.string());
        lspc::ScopedDocument document(session, uri, text.str(), languageIdFor(file));
        lspc::JSONValue symbols = session.DocumentSymbols(document.Uri()).get();
        std::cout << file.string() << ":" << std::endl;
        printSymbols(symbols, 1);
    } catch (const lspc::errors::LspException& e) {
        LOG_ERROR("lspc_symbols: {}", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }
    session.Shutdown();
    return 0;
}
