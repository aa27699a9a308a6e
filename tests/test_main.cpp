// tests/test_main.cpp
#include "test_framework.hpp"

// No tests here; all tests are registered via static initializers
// in the other compilation units. This TU just provides main().
// An optional argument runs only the tests whose name starts with it.
int main(int argc, char** argv) {
    const std::string filter = argc > 1 ? argv[1] : "";
    const auto& tests = tfw::registry();
    std::size_t ran = 0, passed = 0;
    for (const auto& test : tests) {
        if (!filter.empty() && test.name.rfind(filter, 0) != 0) continue;
        ++ran;
        std::cout << "[ RUN      ] " << test.name << std::endl;
        auto start = std::chrono::high_resolution_clock::now();
        try {
            test.fn();
            auto end = std::chrono::high_resolution_clock::now();
            std::chrono::duration<double> elapsed = end - start;
            std::cout << "[       OK ] " << test.name << " (" << elapsed.count() << "s)" << std::endl;
            ++passed;
        } catch (const tfw::Failure& e) {
            auto end = std::chrono::high_resolution_clock::now();
            std::chrono::duration<double> elapsed = end - start;
            std::cout << e.what() << std::endl;
            std::cout << "[  FAILED  ] " << test.name << " (" << elapsed.count() << "s)" << std::endl;
        } catch (const std::exception& e) {
            auto end = std::chrono::high_resolution_clock::now();
            std::chrono::duration<double> elapsed = end - start;
            std::cout << "[  EXCEPTION  ] " << test.name << ": " << e.what() << " (" << elapsed.count() << "s)" << std::endl;
        } catch (...) {
            auto end = std::chrono::high_resolution_clock::now();
            std::chrono::duration<double> elapsed = end - start;
            std::cout << "[  UNKNOWN EXCEPTION  ] " << test.name << " (" << elapsed.count() << "s)" << std::endl;
        }
    }
    std::cout << "[==========] " << ran << " tests ran. " << passed << " passed, " << (ran - passed) << " failed." << std::endl;
    return (passed == ran) ? 0 : 1;
}
