#include "element/AttributeStore.hpp"

namespace SD {

auto AttributeStore::set(std::string_view name, AttributeValue value) -> void {
    if (auto it = index_.find(name); it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    entries_.emplace_back(std::string(name), std::move(value));
    index_.emplace(entries_.back().first, entries_.size() - 1);
}

auto AttributeStore::get(std::string_view name) const -> AttributeValue const* {
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &entries_[it->second].second;
}

auto AttributeStore::slot(std::string_view name) -> AttributeValue* {
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &entries_[it->second].second;
}

auto AttributeStore::contains(std::string_view name) const -> bool {
    return index_.find(name) != index_.end();
}

auto AttributeStore::erase(std::string_view name) -> bool {
    auto it = index_.find(name);
    if (it == index_.end())
        return false;
    auto const removed = it->second;
    index_.erase(it);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(removed));
    for (auto& [key, position] : index_)
        if (position > removed)
            --position;
    return true;
}

auto AttributeStore::text(std::string_view name) const -> std::optional<std::string> {
    auto const* value = this->get(name);
    if (value == nullptr || isNull(*value))
        return std::nullopt;
    return attributeText(*value);
}

auto AttributeStore::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (auto const& entry : entries_)
        result.push_back(entry.first);
    return result;
}

} // namespace SD
