#ifndef FREQCARD_CORE_ERRORS_H
#define FREQCARD_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace freqcard {

// Invalid request: unknown scene, wrong label count for a fixed layout.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or unreadable asset (background template, output destination).
class AssetError : public std::runtime_error {
public:
    explicit AssetError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace freqcard

#endif // FREQCARD_CORE_ERRORS_H
