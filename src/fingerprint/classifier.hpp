#pragma once

#include <functional>
#include <string>
#include <vector>
#include "device_type.hpp"

// One entry in the signature cascade. test() receives lower-cased text.
struct Signature {
    std::string name;
    DeviceType type;
    std::function<bool(const std::string&)> test;
};

// Ordered signature cascade; the first matching signature wins. Explicit
// vendor strings come first, OS families next, bare model numbers last.
class DeviceClassifier {
public:
    DeviceClassifier();

    DeviceType classify(const std::string& text) const;

    // Name of the signature that fired on the last classify(), empty on a miss
    const std::string& last_match() const { return last_match_; }


private:
    std::vector<Signature> signatures_;
    mutable std::string last_match_;
};

// Convenience wrapper around a default DeviceClassifier.
DeviceType classify_device(const std::string& text);
