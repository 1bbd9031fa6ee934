// tests/test-tokens/main.cpp
#include <iostream>
#include <string>
#include <vector>
#include "escrle/token.hpp"

int main(int argc, char** argv) {
    // 1) Build a single raw stream out of argv[]
    std::string raw;
    for (int i = 1; i < argc; ++i) {
        raw += argv[i];
        if (i < argc - 1) raw += ' ';
    }

    // 2) Tokenize it
    std::vector<escrle::Token> toks;
    escrle::Fault fault;
    const bool ok = escrle::tokenize(raw, toks, fault);

    // 3) Print the stream
    std::cout << "Stream: " << raw << "\n\n";

    // 4) Print every token that was scanned, even on failure
    std::cout << "Tokens:\n";
    if (toks.empty()) {
        std::cout << "  (none)\n";
    } else {
        for (const auto& t : toks) {
            std::cout << "  @" << t.offset << "  " << escrle::to_text(t)
                      << "  literal=" << t.literal_str()
                      << "  count=" << t.count
                      << (t.escaped ? "  escaped" : "") << "\n";
        }
    }
    std::cout << "\n";

    // 5) Print the verdict
    if (ok) {
        std::cout << "Result: ok\n";
        return 0;
    }
    std::cout << "Result: " << escrle::error_name(fault.code)
              << " at " << fault.offset << "\n";
    return 1;
}
