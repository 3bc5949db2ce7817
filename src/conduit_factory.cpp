#include "conduit_factory.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <memory>
#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace conduit {
namespace detail {

std::string generate_node_id(const std::string& name) {
    static std::atomic<unsigned long> counter{0};
    std::string slug;
    for (unsigned char c : name) {
        slug += std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_';
    }
    if (slug.empty()) slug = "node";
    return slug + "_" + std::to_string(++counter);
}

std::string demangle(const char* mangled) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> readable(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && readable) return readable.get();
#endif
    return mangled;
}

} // namespace detail
} // namespace conduit
