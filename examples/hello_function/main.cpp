/// Hello function: greets whoever is named in the request body.
/// Usage: run inside an Fn http-stream container (FN_LISTENER=unix:/path).
/// Accepts any supported content type; answers in the same one.

#include <fdk/fdk.hpp>
#include <iostream>

int main() {
    try {
        fdk::run<std::string, std::string>([](fdk::RuntimeContext&, std::string name) {
            while (!name.empty() && name.back() == '\n') name.pop_back();
            return "Hello " + (name.empty() ? std::string("world") : name) + "!";
        });
    } catch (const fdk::FdkError& e) {
        std::cerr << "function invocation error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
