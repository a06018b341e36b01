#pragma once

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace lexport::test {

using Bytes = std::vector<std::uint8_t>;

inline int& Failures() {
    static int failures = 0;
    return failures;
}

inline void Check(bool ok, const std::string& label) {
    std::cout << "  " << label << ": " << (ok ? "true" : "false") << std::endl;
    if (!ok) {
        ++Failures();
    }
}

// Passes when `fn` throws E, and, if given, the message matches exactly.
template <typename E, typename F>
void CheckThrows(F&& fn, const std::string& label, const std::string& message = {}) {
    bool ok = false;
    std::string what = "no exception";
    try {
        fn();
    } catch (const E& exc) {
        what = exc.what();
        ok = message.empty() || what == message;
    } catch (const std::exception& exc) {
        what = std::string("unexpected exception: ") + exc.what();
    }
    std::cout << "  " << label << ": " << (ok ? "true" : "false");
    if (!ok) {
        std::cout << " (" << what << ")";
    }
    std::cout << std::endl;
    if (!ok) {
        ++Failures();
    }
}

inline void Section(const std::string& name) {
    std::cout << name << std::endl;
}

// Key derivation at full strength makes the suites crawl.
inline void UseFastKdf() {
    ::setenv("LEXPORT_TEST_KDF_ITERS", "1000", 1);
}

// Deterministic xorshift filler; the same seed always gives the same bytes.
inline Bytes Pattern(std::size_t size, std::uint32_t seed = 0x9E3779B9u) {
    Bytes out(size);
    std::uint32_t state = seed ? seed : 1u;
    for (std::size_t i = 0; i < size; ++i) {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        out[i] = static_cast<std::uint8_t>(state & 0xFF);
    }
    return out;
}

inline Bytes ToBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

inline int Finish(const char* suite) {
    if (Failures() == 0) {
        std::cout << suite << ": all checks passed" << std::endl;
        return 0;
    }
    std::cout << suite << ": " << Failures() << " check(s) failed" << std::endl;
    return 1;
}

}  // namespace lexport::test
