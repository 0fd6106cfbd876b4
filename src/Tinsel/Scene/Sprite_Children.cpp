//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <iterator>
#include <utility>

#include <Tinsel/Base/Logging.h>
#include <Tinsel/Scene/Sprite.h>

using tinsel::scene::NodeId;
using tinsel::scene::Sprite;

auto Sprite::AddChild(Sprite&& child) -> NodeId
{
  const auto id = child.GetId();
  DCHECK_F(!child_index_.contains(id), "sprite {} is already a child of {}",
    to_string(id), to_string(id_));

  children_.push_back(std::move(child));
  child_index_.insert_or_assign(id, children_.size() - 1);

  DLOG_F(2, "sprite {}: added child {} at {}", to_string(id_), to_string(id),
    children_.size() - 1);
  DCHECK_F(IsChildIndexConsistent());
  return id;
}

/*!
 The direct children are checked first, through the children index. On a hit
 the child is extracted from the ordered sequence and every later sibling is
 reindexed. Otherwise each child's subtree is searched in order, and the first
 one containing `id` performs the removal; no other subtree is modified.

 @return The removed sprite, with its own subtree, or an empty optional if no
 sprite with this `id` exists below this one. A sprite never finds itself.
*/
auto Sprite::RemoveChild(const NodeId& id) -> std::optional<Sprite>
{
  if (const auto it = child_index_.find(id); it != child_index_.end()) {
    const auto position = it->second;
    child_index_.erase(it);

    const auto child_it
      = std::next(children_.begin(), static_cast<std::ptrdiff_t>(position));
    std::optional<Sprite> removed { std::move(*child_it) };
    children_.erase(child_it);
    ReindexChildrenFrom(position);

    DLOG_F(2, "sprite {}: removed child {} from {}", to_string(id_),
      to_string(id), position);
    DCHECK_F(IsChildIndexConsistent());
    return removed;
  }

  for (auto& child : children_) {
    if (auto removed = child.RemoveChild(id)) {
      return removed;
    }
  }
  return std::nullopt;
}

auto Sprite::FindChild(const NodeId& id) const -> OptionalConstRef
{
  if (const auto it = child_index_.find(id); it != child_index_.end()) {
    return std::cref(children_[it->second]);
  }

  for (const auto& child : children_) {
    if (auto found = child.FindChild(id)) {
      return found;
    }
  }
  return std::nullopt;
}

auto Sprite::FindChild(const NodeId& id) -> OptionalRef
{
  if (const auto it = child_index_.find(id); it != child_index_.end()) {
    return std::ref(children_[it->second]);
  }

  for (auto& child : children_) {
    if (auto found = child.FindChild(id)) {
      return found;
    }
  }
  return std::nullopt;
}

// Positions of every child from `position` onwards shifted down by one after
// an erase.
auto Sprite::ReindexChildrenFrom(const std::size_t position) -> void
{
  for (auto i = position; i < children_.size(); ++i) {
    child_index_.insert_or_assign(children_[i].GetId(), i);
  }
}

auto Sprite::IsChildIndexConsistent() const -> bool
{
  if (child_index_.size() != children_.size()) {
    return false;
  }
  for (std::size_t i = 0; i < children_.size(); ++i) {
    const auto it = child_index_.find(children_[i].GetId());
    if (it == child_index_.end() || it->second != i) {
      return false;
    }
  }
  return true;
}
