#pragma once
#include "core/Error.hpp"
#include "element/AttributeValue.hpp"
#include "type/TransparentString.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace SD {

template <typename T>
using AttributeRef = Expected<std::reference_wrapper<T>>;

/**
 * Attributes of one element, keyed by qualified name ("fill", "xlink:href").
 *
 * Notes:
 * - Insertion order is kept and drives emission order. Replacing a value keeps
 *   the original position; erasing removes the name from the order.
 * - Values stay raw text until a typed accessor coerces them; the coerced
 *   object replaces the text in place.
 * - Not thread-safe; an element owns its store exclusively.
 */
class AttributeStore {
public:
    using Entry          = std::pair<std::string, AttributeValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    auto set(std::string_view name, AttributeValue value) -> void;
    auto get(std::string_view name) const -> AttributeValue const*;
    auto contains(std::string_view name) const -> bool;
    auto erase(std::string_view name) -> bool;

    // Generic text form of the named value; nullopt when absent or null.
    auto text(std::string_view name) const -> std::optional<std::string>;

    // Snapshot of the names in insertion order.
    auto names() const -> std::vector<std::string>;

    auto size() const noexcept -> std::size_t { return entries_.size(); }
    auto empty() const noexcept -> bool { return entries_.empty(); }
    auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    auto end() const noexcept -> const_iterator { return entries_.end(); }

    /**
     * Typed read with lazy coercion. Returns the stored object, so edits made
     * through the reference persist. The reference is valid until the next
     * set() of a new name or erase().
     * - A stored T is returned as is.
     * - Stored text (or a value of another type) is converted with coerce(text);
     *   the result replaces the stored value. Coercion errors are returned
     *   unchanged and leave the store untouched.
     * - A missing or null value materializes a default T, which is stored.
     */
    template <typename T, typename Coerce>
    auto getTyped(std::string_view name, Coerce&& coerce) -> AttributeRef<T>;

private:
    using IndexMap = phmap::flat_hash_map<std::string, std::size_t, TransparentStringHash, std::equal_to<>>;

    auto slot(std::string_view name) -> AttributeValue*;

    std::vector<Entry> entries_;
    IndexMap           index_;
};

template <typename T, typename Coerce>
auto AttributeStore::getTyped(std::string_view name, Coerce&& coerce) -> AttributeRef<T> {
    static_assert(std::is_default_constructible_v<T>, "typed attributes need a default instance");

    auto* stored = this->slot(name);
    if (stored == nullptr || isNull(*stored)) {
        this->set(name, AttributeValue{T{}});
        return std::ref(std::get<T>(*this->slot(name)));
    }
    if (auto* typed = std::get_if<T>(stored))
        return std::ref(*typed);

    Expected<T> coerced = std::invoke(std::forward<Coerce>(coerce), attributeText(*stored));
    if (!coerced)
        return std::unexpected(coerced.error());
    *stored = std::move(*coerced);
    return std::ref(std::get<T>(*stored));
}

} // namespace SD
