#include <minhttp/net/header_map.h>

namespace minhttp::net {

void HeaderMap::set(const std::string& name, const std::string& value) {
    headers_.insert_or_assign(name, value);
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    auto it = headers_.find(name);
    if (it != headers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool HeaderMap::has(const std::string& name) const {
    return headers_.find(name) != headers_.end();
}

void HeaderMap::remove(const std::string& name) {
    headers_.erase(name);
}

void HeaderMap::merge(const HeaderMap& other) {
    for (const auto& [name, value] : other) {
        headers_.insert_or_assign(name, value);
    }
}

size_t HeaderMap::size() const {
    return headers_.size();
}

bool HeaderMap::empty() const {
    return headers_.empty();
}

bool HeaderMap::operator==(const HeaderMap& other) const {
    return headers_ == other.headers_;
}

HeaderMap::iterator HeaderMap::begin() const {
    return headers_.begin();
}

HeaderMap::iterator HeaderMap::end() const {
    return headers_.end();
}

} // namespace minhttp::net
