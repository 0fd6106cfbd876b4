//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <Tinsel/Base/Macros.h>
#include <Tinsel/Config/SpriteConfig.h>
#include <Tinsel/Graphics/QuadRenderer.h>
#include <Tinsel/Graphics/Texture.h>
#include <Tinsel/Scene/FrameSet.h>
#include <Tinsel/Scene/Transform2D.h>
#include <Tinsel/Scene/Types/NodeId.h>
#include <Tinsel/Scene/api_export.h>

namespace tinsel::scene {

namespace detail {
  struct SpriteChildrenAccess;
} // namespace detail

//! A positioned, tintable, optionally animated textured quad that owns child
//! sprites.
/*!
 A Sprite is a node of a 2D scene graph. There is no separate tree object:
 the root sprite is the tree, and every sprite exclusively owns its children.
 Destroying a sprite destroys its subtree.

 ### Key Characteristics

 - **Identity**: every sprite gets a random NodeId at construction. Ids are
   unique and never change, which is why sprites are move-only.
 - **Local transform**: position, rotation (degrees) and scale, relative to
   the accumulated transform of the parent. The anchor is the normalized pivot
   for rotation, scale and flips, and also places the quad relative to the
   position.
 - **Local-only mirroring**: flipping mirrors this sprite's own quad only. It
   is not part of the transform handed to children, and does not move the
   anchor. To mirror a whole subtree, use a negative scale.
 - **Shared textures**: the texture is shared with other sprites and never
   modified.
 - **Per-node animation**: Update() advances this sprite's clip only. Use
   AdvanceAnimations() to drive a whole subtree.

 ### Children index

 Children are kept in an ordered vector (traversal and paint order) plus an
 id to position map for direct lookups. The map is always the exact inverse of
 the vector: removing a child reindexes every later sibling. Lookups and
 removals first try the direct children through the map, then search the
 subtree depth-first.

 @note Not thread safe. A sprite tree is mutated and drawn by one caller.

 @warning A moved-from sprite has no texture and still reports the id of the
 sprite it was moved into. It may only be destroyed or assigned to.
*/
class Sprite {
public:
  using TexturePtr = std::shared_ptr<const graphics::Texture>;

  using OptionalRef = std::optional<std::reference_wrapper<Sprite>>;
  using OptionalConstRef = std::optional<std::reference_wrapper<const Sprite>>;
  using OptionalFrameSetRef
    = std::optional<std::reference_wrapper<const FrameSet>>;

  //! Creates a sprite showing the whole texture.
  TNSL_SCN_API explicit Sprite(
    TexturePtr texture, const SpriteConfig& config = {});

  //! Creates a sprite showing the `source_rect` region of the texture.
  TNSL_SCN_API Sprite(TexturePtr texture, const Rect& source_rect,
    const SpriteConfig& config = {});

  ~Sprite() = default;

  TINSEL_MAKE_NON_COPYABLE(Sprite)
  TINSEL_DEFAULT_MOVABLE(Sprite)

  [[nodiscard]] auto GetId() const noexcept -> const NodeId& { return id_; }

  //=== Properties ===--------------------------------------------------------//

  [[nodiscard]] auto IsVisible() const noexcept -> bool { return visible_; }
  auto SetVisible(const bool visible) noexcept -> void { visible_ = visible; }

  //! Normalized pivot, (0.5, 0.5) being the center of the source rectangle.
  [[nodiscard]] auto GetAnchor() const noexcept -> const glm::dvec2&
  {
    return anchor_;
  }
  auto SetAnchor(const glm::dvec2& anchor) noexcept -> void
  {
    anchor_ = anchor;
  }

  [[nodiscard]] auto GetPosition() const noexcept -> const glm::dvec2&
  {
    return position_;
  }
  auto SetPosition(const glm::dvec2& position) noexcept -> void
  {
    position_ = position;
  }

  //! Rotation in degrees.
  [[nodiscard]] auto GetRotation() const noexcept -> double
  {
    return rotation_;
  }
  auto SetRotation(const double degrees) noexcept -> void
  {
    rotation_ = degrees;
  }

  [[nodiscard]] auto GetScale() const noexcept -> const glm::dvec2&
  {
    return scale_;
  }
  auto SetScale(const glm::dvec2& scale) noexcept -> void { scale_ = scale; }

  //! Tint color (r, g, b).
  [[nodiscard]] auto GetColor() const noexcept -> const glm::vec3&
  {
    return color_;
  }
  auto SetColor(const glm::vec3& color) noexcept -> void { color_ = color; }

  [[nodiscard]] auto GetOpacity() const noexcept -> float { return opacity_; }
  auto SetOpacity(const float opacity) noexcept -> void { opacity_ = opacity; }

  //! Whether this sprite's own quad is mirrored horizontally.
  /*!
   Only the texture of this sprite is flipped, not its children, and the
   anchor stays where it is.
  */
  [[nodiscard]] auto IsFlipX() const noexcept -> bool { return flip_x_; }
  auto SetFlipX(const bool flip) noexcept -> void { flip_x_ = flip; }

  //! Whether this sprite's own quad is mirrored vertically.
  //! @see IsFlipX()
  [[nodiscard]] auto IsFlipY() const noexcept -> bool { return flip_y_; }
  auto SetFlipY(const bool flip) noexcept -> void { flip_y_ = flip; }

  //! The explicit source rectangle, if any.
  [[nodiscard]] auto GetSourceRect() const noexcept
    -> const std::optional<Rect>&
  {
    return source_rect_;
  }
  auto SetSourceRect(const Rect& source_rect) noexcept -> void
  {
    source_rect_ = source_rect;
  }
  //! Goes back to showing the whole texture when not animating.
  auto ClearSourceRect() noexcept -> void { source_rect_.reset(); }

  [[nodiscard]] auto GetTexture() const noexcept -> const TexturePtr&
  {
    return texture_;
  }
  //! Replaces the texture. Throws std::invalid_argument if `texture` is null.
  TNSL_SCN_API auto SetTexture(TexturePtr texture) -> void;

  //=== Scene Hierarchy ===---------------------------------------------------//

  //! Appends `child` to the children of this sprite.
  /*!
   @return The id of the added child.
  */
  TNSL_SCN_API auto AddChild(Sprite&& child) -> NodeId;

  //! Removes the sprite with the given `id` from this sprite's subtree.
  TNSL_SCN_NDAPI auto RemoveChild(const NodeId& id) -> std::optional<Sprite>;

  //! Finds the sprite with the given `id` in this sprite's subtree.
  TNSL_SCN_NDAPI auto FindChild(const NodeId& id) const -> OptionalConstRef;
  TNSL_SCN_NDAPI auto FindChild(const NodeId& id) -> OptionalRef;

  //! Direct children, in traversal order.
  [[nodiscard]] auto GetChildren() const noexcept
    -> const std::vector<Sprite>&
  {
    return children_;
  }

  [[nodiscard]] auto HasChildren() const noexcept -> bool
  {
    return !children_.empty();
  }

  //=== Animation ===---------------------------------------------------------//

  //! Registers a named animation clip.
  /*!
   @return `true` if registered; `false` if the name is already taken (the
   first registration wins) or `frames` is empty.
  */
  TNSL_SCN_API auto AddFrameSet(std::string_view name, bool repeat,
    double frame_time, std::vector<Rect> frames) -> bool;

  //! Registers a clip of `count` frames tiled rightward from `base`.
  //! @see MakeHorizontalFrames()
  TNSL_SCN_API auto AddFrameSetHorizontal(std::string_view name, bool repeat,
    double frame_time, const Rect& base, std::uint32_t count) -> bool;

  [[nodiscard]] auto HasFrameSet(const std::string_view name) const -> bool
  {
    return frame_sets_.contains(std::string(name));
  }

  TNSL_SCN_NDAPI auto GetFrameSet(std::string_view name) const
    -> OptionalFrameSetRef;

  //! Starts playing the clip registered as `name`.
  TNSL_SCN_NDAPI auto Play(std::string_view name,
    std::optional<std::string_view> followup = std::nullopt) -> bool;

  //! Stops the active clip. The sprite goes back to its source rectangle.
  TNSL_SCN_API auto Stop() noexcept -> void;

  //! Advances the animation timer of this sprite by `dt` seconds.
  TNSL_SCN_API auto Update(double dt) -> void;

  [[nodiscard]] auto IsPlaying() const noexcept -> bool
  {
    return active_.has_value();
  }

  //! Name of the active clip, empty when idle.
  TNSL_SCN_NDAPI auto GetActiveFrameSetName() const noexcept
    -> std::optional<std::string_view>;

  //! Clip to play after the active one finishes, if any.
  TNSL_SCN_NDAPI auto GetFollowup() const noexcept
    -> std::optional<std::string_view>;

  [[nodiscard]] auto GetFrameIndex() const noexcept -> std::size_t
  {
    return frame_index_;
  }

  //! Time accumulated since the last frame change, in seconds.
  [[nodiscard]] auto GetFrameElapsed() const noexcept -> double
  {
    return frame_elapsed_;
  }

  //=== Rendering ===---------------------------------------------------------//

  //! Draws this sprite and its visible descendants.
  /*!
   @param parent_transform Accumulated transform of the parent space.
   @param renderer Backend receiving one quad per visible sprite.
  */
  TNSL_SCN_API auto Draw(
    const Mat3& parent_transform, graphics::QuadRenderer& renderer) const
    -> void;

  //! Draws this sprite and its visible descendants with a tint override.
  TNSL_SCN_API auto DrawTinted(const Mat3& parent_transform,
    graphics::QuadRenderer& renderer, const glm::vec3& color) const -> void;

  //=== Geometry ===----------------------------------------------------------//

  //! The region of the texture currently displayed.
  TNSL_SCN_NDAPI auto GetActiveSourceRect() const -> Rect;

  //! Axis aligned box of the sprite in its parent's space, ignoring rotation.
  TNSL_SCN_NDAPI auto GetBoundingBox() const -> Rect;

private:
  friend struct detail::SpriteChildrenAccess;

  struct ActiveClip {
    std::string name;
    FrameSet frame_set;
  };

  auto DrawImpl(const Mat3& parent_transform, graphics::QuadRenderer& renderer,
    const std::optional<glm::vec3>& tint_override) const -> void;

  //! Source rectangle handed to the renderer; empty for the full texture.
  [[nodiscard]] auto GetSubmittedSourceRect() const -> std::optional<Rect>;

  auto ReindexChildrenFrom(std::size_t position) -> void;

  [[nodiscard]] auto IsChildIndexConsistent() const -> bool;

  NodeId id_;

  bool visible_;

  glm::dvec2 anchor_;

  glm::dvec2 position_ { 0.0, 0.0 };
  double rotation_ { 0.0 };
  glm::dvec2 scale_ { 1.0, 1.0 };

  glm::vec3 color_;
  float opacity_;

  bool flip_x_ { false };
  bool flip_y_ { false };

  std::optional<Rect> source_rect_;
  TexturePtr texture_;

  std::optional<ActiveClip> active_;
  std::optional<std::string> followup_;
  std::unordered_map<std::string, FrameSet> frame_sets_;
  std::size_t frame_index_ { 0 };
  double frame_elapsed_ { 0.0 };

  std::vector<Sprite> children_;
  std::unordered_map<NodeId, std::size_t> child_index_;
};

namespace detail {

  //! Mutable access to the children vector for traversal algorithms.
  /*!
   Elements may be modified in place, but the vector itself must not be
   resized or reordered, nor elements replaced, as that would break the
   children index.
  */
  struct SpriteChildrenAccess {
    static auto Children(Sprite& sprite) noexcept -> std::vector<Sprite>&
    {
      return sprite.children_;
    }
  };

} // namespace detail

} // namespace tinsel::scene
