#include "type_name.h"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>

#if FLAT_ENABLE_DEMANGLING
#include <cxxabi.h>
#endif

#include "../logging/logger.h"

namespace flat::core::error {

namespace {

class TypeNameRegistry {
public:
    static TypeNameRegistry& instance() {
        static TypeNameRegistry registry;
        return registry;
    }

    std::string_view lookup(const std::type_info& info) {
        const std::type_index key(info);

        {
            std::shared_lock lock(mutex_);
            auto it = names_.find(key);
            if (it != names_.end()) {
                return it->second;
            }
        }

        // Demangle outside the lock; a racing thread may do the same work,
        // the first insertion wins.
        std::string name = demangle(info.name());

        std::unique_lock lock(mutex_);
        return names_.try_emplace(key, std::move(name)).first->second;
    }

private:
    TypeNameRegistry() = default;

    static std::string demangle(const char* mangled) {
#if FLAT_ENABLE_DEMANGLING
        int status = 0;
        std::unique_ptr<char, decltype(&std::free)> demangled(
            abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);

        if (status == 0 && demangled) {
            return std::string(demangled.get());
        }

        FLAT_LOG_WARN(logging::library_logger(),
                      "could not demangle type name '{}' (status {})", mangled, status);
#endif
        return std::string(mangled);
    }

    // Node-based map: element addresses are stable across rehashing, which
    // keeps every returned string_view valid.
    std::unordered_map<std::type_index, std::string> names_;
    std::shared_mutex mutex_;
};

} // namespace

std::string_view type_name(const std::type_info& info) {
    return TypeNameRegistry::instance().lookup(info);
}

} // namespace flat::core::error
