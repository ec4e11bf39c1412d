#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include "infrastructure/FileTextDocument.hpp"

using namespace draftlens;
using infrastructure::FileEditorHost;
using infrastructure::FileTextDocument;
using domain::TextRange;
namespace fs = std::filesystem;

static std::string ReadAll(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int main() {
    std::cout << "[Test] Starting FileTextDocument Test..." << std::endl;

    fs::path dir = fs::temp_directory_path() / "draftlens_document_test";
    fs::create_directories(dir);
    fs::path file = dir / "chapter.md";
    {
        std::ofstream out(file, std::ios::binary);
        out << "第一行\n第二行 world\n";
    }

    auto doc = FileTextDocument::Open(file.string());
    assert(doc->lineCount() == 3);
    assert(doc->version() == 1);
    assert(doc->getText({1, 4, 1, 9}) == "world");
    assert(doc->getText({0, 1, 1, 2}) == "一行\n第二");
    assert(doc->getText({0, 0, 0, 100}) == "第一行" && "Columns past the end are clamped.");
    std::cout << "[PASS] getText" << std::endl;

    bool threw = false;
    try {
        doc->getText({5, 0, 5, 1});
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        doc->getText({0, 3, 0, 1});
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] invalid ranges throw" << std::endl;

    assert(!doc->replace({9, 0, 9, 1}, "x"));
    assert(doc->version() == 1);

    assert(doc->replace({0, 2, 1, 3}, "段"));
    assert(doc->content() == "第一段 world\n");
    assert(doc->lineCount() == 2);
    assert(doc->version() == 2);
    assert(doc->isDirty());

    assert(doc->replace({0, 0, 0, 0}, "标题\n"));
    assert(doc->content() == "标题\n第一段 world\n");
    assert(doc->version() == 3);
    std::cout << "[PASS] replace" << std::endl;

    assert(doc->save());
    assert(!doc->isDirty());
    assert(ReadAll(file) == "标题\n第一段 world\n");
    std::cout << "[PASS] save" << std::endl;

    FileEditorHost host;
    assert(!host.activeDocument());
    auto opened = host.open(file.string());
    assert(host.activeDocument() == opened);
    assert(host.isWritable(file.string()));
    assert(!host.isWritable((dir / "absent.md").string()));
    assert(!host.isWritable(dir.string()));
    host.closeActive();
    assert(!host.activeDocument());

    threw = false;
    try {
        host.open((dir / "absent.md").string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] editor host" << std::endl;

    fs::remove_all(dir);
    std::cout << "[Test] FileTextDocument Test completed." << std::endl;
    return 0;
}
