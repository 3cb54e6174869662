#pragma once

#ifndef CORE_ERROR_ERROR_CHAIN_H
#define CORE_ERROR_ERROR_CHAIN_H

#include <exception>
#include <sstream>
#include <string>
#include <vector>

#include "error_source.h"
#include "../config/config.h"

namespace flat::core::error {

/**
 * @brief Walks the causal chain of an exception
 *
 * Works the same on an original exception chain (ErrorSource or
 * std::throw_with_nested) and on its flattened FlatError copy, so the two
 * can be compared link by link.
 */
class ErrorChain {
public:
    /**
     * @brief Call f on every std::exception in the chain, outermost first
     *
     * Foreign nested payloads end the walk without a call.
     */
    template<typename F>
        requires std::invocable<F&, const std::exception&>
    static void for_each(const std::exception& e, F&& f) {
        f(e);
        with_source(e, [&f](const std::exception& source) {
            for_each(source, f);
        });
    }

    /**
     * @brief Messages from e down to the root cause
     */
    static std::vector<std::string> messages(const std::exception& e) {
        std::vector<std::string> chain;
        collect(e, chain);
        return chain;
    }

    /**
     * @brief Number of links in the chain, e included
     */
    static size_t depth(const std::exception& e) {
        return messages(e).size();
    }

    /**
     * @brief Message of the innermost link
     */
    static std::string root_cause(const std::exception& e) {
        auto chain = messages(e);
        return chain.back();
    }

    /**
     * @brief Format the chain as a single string
     */
    static std::string format(const std::exception& e,
                              const std::string& separator = "\n  Caused by: ") {
        auto chain = messages(e);

        std::ostringstream oss;
        oss << chain[0];
        for (size_t i = 1; i < chain.size(); ++i) {
            oss << separator << chain[i];
        }
        return oss.str();
    }

private:
    static void collect(const std::exception& e, std::vector<std::string>& chain) {
        chain.emplace_back(e.what());

        const SourceKind kind = with_source(e, [&chain](const std::exception& source) {
            collect(source, chain);
        });
        if (kind == SourceKind::Foreign) {
            chain.emplace_back(config::UNKNOWN_NESTED_MESSAGE);
        }
    }
};

} // namespace flat::core::error

#endif // CORE_ERROR_ERROR_CHAIN_H
