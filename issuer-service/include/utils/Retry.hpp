#pragma once

#include <optional>
#include <type_traits>
#include <utility>

namespace issuer::utils {

/**
 * @brief Ограниченный повтор: generate() до maxAttempts раз, пока accept() не вернёт true
 *
 * Возвращает первого принятого кандидата или nullopt, если попытки исчерпаны.
 * Исключения из generate() и accept() пробрасываются без повторов.
 *
 * @example
 * ```cpp
 * auto pan = utils::retryBounded(6,
 *     [&] { return generatePanWithLength(bin, 16, ""); },
 *     [&](const std::string& p) { return !exists(p); });
 * ```
 */
template <typename Generator, typename Accept>
auto retryBounded(int maxAttempts, Generator&& generate, Accept&& accept)
    -> std::optional<std::decay_t<std::invoke_result_t<Generator&>>>
{
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        auto candidate = generate();
        if (accept(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace issuer::utils
