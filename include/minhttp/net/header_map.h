#pragma once
#include <optional>
#include <string>
#include <unordered_map>

namespace minhttp::net {

// Header names are stored exactly as given; "Host" and "host" are distinct
// keys. A second set() for the same name replaces the first value.
class HeaderMap {
public:
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    void merge(const HeaderMap& other);
    size_t size() const;
    bool empty() const;

    bool operator==(const HeaderMap& other) const;
    bool operator!=(const HeaderMap& other) const { return !(*this == other); }

    // Iteration order is unspecified.
    using iterator = std::unordered_map<std::string, std::string>::const_iterator;
    iterator begin() const;
    iterator end() const;

private:
    std::unordered_map<std::string, std::string> headers_;
};

} // namespace minhttp::net
