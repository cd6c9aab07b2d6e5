#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SD {

enum class TransformKind {
    Matrix,
    Translate,
    Scale,
    Rotate,
    SkewX,
    SkewY
};

[[nodiscard]] auto transformKindName(TransformKind kind) -> std::string_view;
[[nodiscard]] auto transformKindFromName(std::string_view name) -> std::optional<TransformKind>;

struct Transform {
    TransformKind      kind;
    std::vector<float> arguments;

    bool operator==(Transform const& other) const = default;
};

/**
 * A transform attribute value ("translate(10,20) rotate(45)"). The empty
 * list is the identity.
 */
class TransformList {
public:
    TransformList() = default;

    static auto fromText(std::string_view text) -> Expected<TransformList>;

    // Canonical form: kind(a,b,...) items joined by single spaces.
    auto toString() const -> std::string;

    auto append(Transform transform) -> std::optional<Error>;

    auto size() const noexcept -> std::size_t { return transforms_.size(); }
    auto empty() const noexcept -> bool { return transforms_.empty(); }
    auto operator[](std::size_t index) const -> Transform const& { return transforms_[index]; }
    auto transforms() const noexcept -> std::vector<Transform> const& { return transforms_; }

    bool operator==(TransformList const& other) const = default;

private:
    std::vector<Transform> transforms_;
};

} // namespace SD
