#include "domain/PanGenerator.hpp"
#include "domain/Exceptions.hpp"
#include "utils/Retry.hpp"
#include "utils/SecureRandom.hpp"

#include <algorithm>

namespace issuer::domain::pan {

namespace {

std::string trim(const std::string& s) {
    const auto* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

void validateBin(const std::string& bin) {
    if (bin.empty()) {
        throw ValidationException("bin is required");
    }
    if (!isDigits(bin)) {
        throw ValidationException("bin must contain digits only");
    }
    if (bin.size() != 6 && bin.size() != 8 && bin.size() != 9) {
        throw ValidationException("bin must be 6, 8, or 9 digits");
    }
}

void validatePan(const std::string& pan) {
    if (pan.empty()) {
        throw ValidationException("pan is required");
    }
    if (!isDigits(pan)) {
        throw ValidationException("pan must contain digits only");
    }
    if (pan.size() < 13 || pan.size() > 19) {
        throw ValidationException(
            "pan length must be 13..19 digits (got " + std::to_string(pan.size()) + ")");
    }
    if (pan.back() != luhnCheckDigit(pan.substr(0, pan.size() - 1))) {
        throw ValidationException("invalid luhn check digit");
    }
}

std::string generatePan(const std::string& bin, const std::string& sequence) {
    return generatePanWithLength(bin, kDefaultPanLength, sequence);
}

std::string generatePanWithLength(const std::string& bin, int totalLen,
                                  const std::string& sequence) {
    validateBin(bin);
    if (totalLen < 13 || totalLen > 19) {
        throw ValidationException("total length must be 13..19");
    }

    const int fill = totalLen - 1 - static_cast<int>(bin.size());
    if (fill <= 0) {
        throw ValidationException("bin too long: " + bin);
    }

    const std::string seq = trim(sequence);
    if (!seq.empty()) {
        if (!isDigits(seq)) {
            throw ValidationException("sequence must be numeric");
        }
        if (static_cast<int>(seq.size()) > fill) {
            throw ValidationException(
                "sequence length " + std::to_string(seq.size()) +
                " exceeds " + std::to_string(fill));
        }
    }

    std::string digits = utils::SecureRandom::instance().digits(static_cast<size_t>(fill));
    if (!seq.empty()) {
        digits.replace(digits.size() - seq.size(), seq.size(), seq);
    }

    std::string body = bin + digits;
    body.push_back(luhnCheckDigit(body));
    return body;
}

std::string generateUniquePan(const std::string& bin, int totalLen,
                              const std::string& sequence, int maxRetries,
                              const ExistsFn& exists) {
    if (maxRetries <= 0) {
        maxRetries = kDefaultUniqueRetries;
    }

    auto pan = utils::retryBounded(maxRetries + 1,
        [&] { return generatePanWithLength(bin, totalLen, sequence); },
        [&](const std::string& candidate) { return !exists || !exists(candidate); });

    if (!pan) {
        throw RetryExhaustedException(
            "failed to generate unique PAN after " + std::to_string(maxRetries) + " retries");
    }
    return *pan;
}

std::string maskPan(const std::string& pan) {
    const std::string cleaned = normalizePan(pan);
    const size_t n = cleaned.size();
    if (n == 0) {
        return "";
    }
    if (n <= 4) {
        return std::string(n, '*');
    }
    if (n < 10) {
        return std::string(n - 4, '*') + cleaned.substr(n - 4);
    }
    return cleaned.substr(0, 6) + std::string(n - 10, '*') + cleaned.substr(n - 4);
}

std::string normalizePan(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : trim(s)) {
        if (c != ' ' && c != '\t' && c != '-') {
            out.push_back(c);
        }
    }
    return out;
}

std::string lastN(const std::string& s, size_t n) {
    if (s.size() <= n) {
        return s;
    }
    return s.substr(s.size() - n);
}

bool isDigits(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

char luhnCheckDigit(const std::string& body) {
    int sum = 0;
    bool doubleIt = true;
    for (auto it = body.rbegin(); it != body.rend(); ++it) {
        int d = *it - '0';
        if (doubleIt) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        doubleIt = !doubleIt;
    }
    return static_cast<char>('0' + (10 - sum % 10) % 10);
}

} // namespace issuer::domain::pan
